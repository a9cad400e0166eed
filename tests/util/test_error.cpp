#include "util/error.hpp"

#include <catch2/catch_test_macros.hpp>
#include <memory>
#include <string>

using namespace polarbear;

TEST_CASE("ErrorCode enum values are distinct", "[error]") {
    REQUIRE(static_cast<int>(ErrorCode::ok) == 0);
    REQUIRE(ErrorCode::file_not_found != ErrorCode::ok);
    REQUIRE(ErrorCode::integrity_mismatch != ErrorCode::corrupt_archive);
}

TEST_CASE("error_code_name returns the enumerator spelling", "[error]") {
    REQUIRE(std::string(error_code_name(ErrorCode::ok)) == "ok");
    REQUIRE(std::string(error_code_name(ErrorCode::file_not_found)) == "file_not_found");
    REQUIRE(std::string(error_code_name(ErrorCode::transient_network)) == "transient_network");
    REQUIRE(std::string(error_code_name(ErrorCode::restart_threshold_exceeded)) ==
            "restart_threshold_exceeded");
    REQUIRE(std::string(error_code_name(ErrorCode::unknown_error)) == "unknown_error");
}

TEST_CASE("Error classes", "[error]") {
    SECTION("Only network errors are transient") {
        REQUIRE(is_transient(ErrorCode::transient_network));
        REQUIRE_FALSE(is_transient(ErrorCode::download_failed));
        REQUIRE_FALSE(is_transient(ErrorCode::disk_full));
    }

    SECTION("Digest and archive failures are integrity errors") {
        REQUIRE(is_integrity_error(ErrorCode::integrity_mismatch));
        REQUIRE(is_integrity_error(ErrorCode::corrupt_archive));
        REQUIRE_FALSE(is_integrity_error(ErrorCode::download_failed));
        REQUIRE_FALSE(is_integrity_error(ErrorCode::cancelled));
    }
}

TEST_CASE("Error struct construction", "[error]") {
    SECTION("Basic construction") {
        Error error{ErrorCode::file_not_found, "Test message"};
        REQUIRE(error.code == ErrorCode::file_not_found);
        REQUIRE(error.message == "Test message");
        REQUIRE(error.location.file_name() != nullptr);
    }

    SECTION("Construction with custom source location") {
        auto loc = std::source_location::current();
        Error error{ErrorCode::parse_error, "Parse failed", loc};
        REQUIRE(error.code == ErrorCode::parse_error);
        REQUIRE(error.location.line() == loc.line());
    }
}

TEST_CASE("make_error captures the caller", "[error]") {
    auto line_before = static_cast<uint32_t>(__LINE__);
    auto error_result = make_error<int>(ErrorCode::disk_full, "No space");
    auto line_after = static_cast<uint32_t>(__LINE__);

    REQUIRE(!error_result.has_value());
    REQUIRE(error_result.error().code == ErrorCode::disk_full);
    REQUIRE(error_result.error().message == "No space");
    REQUIRE(error_result.error().location.line() > line_before);
    REQUIRE(error_result.error().location.line() < line_after);
}

TEST_CASE("ResultPtr helpers", "[error]") {
    auto ok = make_result_ptr(std::make_unique<int>(7));
    REQUIRE(ok.has_value());
    REQUIRE(**ok == 7);

    auto failed = make_result_ptr_error<int>(ErrorCode::no_compatible_config, "none");
    REQUIRE(!failed.has_value());
    REQUIRE(failed.error().code == ErrorCode::no_compatible_config);
}

namespace {

auto half(int value) -> Result<int> {
    if (value % 2 != 0) {
        return make_error<int>(ErrorCode::invalid_data, "odd");
    }
    return value / 2;
}

auto quarter(int value) -> Result<int> {
    int halved = POLARBEAR_TRY(half(value));
    return POLARBEAR_TRY(half(halved));
}

auto check_even(int value) -> Result<void> {
    POLARBEAR_TRY(half(value));
    return {};
}

} // namespace

TEST_CASE("POLARBEAR_TRY propagates the first error", "[error]") {
    REQUIRE(quarter(8).value() == 2);

    auto failed = quarter(6);
    REQUIRE(!failed);
    REQUIRE(failed.error().code == ErrorCode::invalid_data);

    REQUIRE(check_even(4).has_value());
    REQUIRE_FALSE(check_even(3).has_value());
}

TEST_CASE("Result<T> chaining operations", "[error]") {
    SECTION("Transform success case") {
        auto result = Result<int>{10};
        auto transformed = result.transform([](int value) { return value * 2; });
        REQUIRE(transformed.value() == 20);
    }

    SECTION("and_then error propagation") {
        auto result = make_error<int>(ErrorCode::parse_error, "Bad input");
        auto chained = result.and_then([](int value) -> Result<std::string> {
            return Result<std::string>{std::to_string(value)};
        });
        REQUIRE(!chained.has_value());
        REQUIRE(chained.error().code == ErrorCode::parse_error);
        REQUIRE(chained.error().message == "Bad input");
    }
}
