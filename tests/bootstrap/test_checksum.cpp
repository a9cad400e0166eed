#include "bootstrap/checksum.hpp"

#include "support/test_helpers.hpp"

#include <catch2/catch_test_macros.hpp>
#include <cctype>
#include <stop_token>
#include <string>

using namespace polarbear;
using polarbear::test::TempDir;
using polarbear::test::write_file;

namespace {

constexpr const char* ABC_SHA256 =
    "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";
constexpr const char* EMPTY_SHA256 =
    "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";

} // namespace

TEST_CASE("sha256_file digests known inputs", "[checksum]") {
    TempDir tmp("polarbear_sha");

    write_file(tmp / "abc", "abc");
    auto abc = bootstrap::sha256_file(tmp / "abc");
    REQUIRE(abc.has_value());
    REQUIRE(*abc == ABC_SHA256);

    write_file(tmp / "empty", "");
    auto empty = bootstrap::sha256_file(tmp / "empty");
    REQUIRE(empty.has_value());
    REQUIRE(*empty == EMPTY_SHA256);
}

TEST_CASE("sha256_file reports progress over large files", "[checksum]") {
    TempDir tmp("polarbear_sha");
    const std::string big(3U * 1024U * 1024U + 17U, 'x');
    write_file(tmp / "big", big);

    uint64_t last_hashed = 0;
    uint64_t last_total = 0;
    int calls = 0;
    auto digest = bootstrap::sha256_file(tmp / "big", {}, [&](uint64_t hashed, uint64_t total) {
        REQUIRE(hashed >= last_hashed);
        last_hashed = hashed;
        last_total = total;
        ++calls;
    });
    REQUIRE(digest.has_value());
    REQUIRE(calls >= 4);
    REQUIRE(last_hashed == big.size());
    REQUIRE(last_total == big.size());
}

TEST_CASE("sha256_file errors", "[checksum]") {
    TempDir tmp("polarbear_sha");

    SECTION("Missing file") {
        auto result = bootstrap::sha256_file(tmp / "missing");
        REQUIRE(!result);
        REQUIRE(result.error().code == ErrorCode::file_not_found);
    }

    SECTION("Cancelled") {
        write_file(tmp / "abc", "abc");
        std::stop_source source;
        source.request_stop();
        auto result = bootstrap::sha256_file(tmp / "abc", source.get_token());
        REQUIRE(!result);
        REQUIRE(result.error().code == ErrorCode::cancelled);
    }
}

TEST_CASE("verify_sha256 compares digests", "[checksum]") {
    TempDir tmp("polarbear_sha");
    write_file(tmp / "abc", "abc");

    REQUIRE(bootstrap::verify_sha256(tmp / "abc", ABC_SHA256).has_value());

    std::string upper(ABC_SHA256);
    for (auto& c : upper) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    REQUIRE(bootstrap::verify_sha256(tmp / "abc", upper).has_value());

    auto mismatch = bootstrap::verify_sha256(tmp / "abc", EMPTY_SHA256);
    REQUIRE(!mismatch);
    REQUIRE(mismatch.error().code == ErrorCode::integrity_mismatch);
}
