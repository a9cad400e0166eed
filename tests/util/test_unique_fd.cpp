#include "util/unique_fd.hpp"

#include <catch2/catch_test_macros.hpp>
#include <fcntl.h>
#include <unistd.h>
#include <utility>

using namespace polarbear::util;

namespace {

auto is_open(int fd) -> bool {
    return ::fcntl(fd, F_GETFD) != -1;
}

auto make_pipe() -> std::pair<UniqueFd, UniqueFd> {
    auto pipe = UniqueFd::pipe();
    REQUIRE(pipe.has_value());
    return {std::move(pipe->read_end), std::move(pipe->write_end)};
}

} // namespace

TEST_CASE("UniqueFd default state", "[unique_fd]") {
    UniqueFd fd;
    REQUIRE_FALSE(fd.valid());
    REQUIRE_FALSE(static_cast<bool>(fd));
    REQUIRE(fd.get() == -1);
    fd.reset();
    REQUIRE_FALSE(fd.valid());
}

TEST_CASE("UniqueFd closes on destruction", "[unique_fd]") {
    int raw = -1;
    {
        auto [read_end, write_end] = make_pipe();
        raw = read_end.get();
        REQUIRE(is_open(raw));
    }
    REQUIRE_FALSE(is_open(raw));
}

TEST_CASE("UniqueFd move transfers ownership", "[unique_fd]") {
    auto [read_end, write_end] = make_pipe();
    const int raw = read_end.get();

    UniqueFd moved(std::move(read_end));
    REQUIRE(moved.get() == raw);
    REQUIRE_FALSE(read_end.valid());

    UniqueFd assigned;
    assigned = std::move(moved);
    REQUIRE(assigned.get() == raw);
    REQUIRE(is_open(raw));

    // Move assignment closes the previous descriptor
    auto [other_read, other_write] = make_pipe();
    const int other_raw = other_read.get();
    assigned = std::move(other_read);
    REQUIRE_FALSE(is_open(raw));
    REQUIRE(assigned.get() == other_raw);
}

TEST_CASE("UniqueFd pipe is close-on-exec", "[unique_fd]") {
    auto [read_end, write_end] = make_pipe();
    REQUIRE((::fcntl(read_end.get(), F_GETFD) & FD_CLOEXEC) != 0);
    REQUIRE((::fcntl(write_end.get(), F_GETFD) & FD_CLOEXEC) != 0);

    REQUIRE(::write(write_end.get(), "x", 1) == 1);
    char byte = 0;
    REQUIRE(::read(read_end.get(), &byte, 1) == 1);
    REQUIRE(byte == 'x');
}

TEST_CASE("UniqueFd reset and close", "[unique_fd]") {
    auto [read_end, write_end] = make_pipe();
    const int old_raw = read_end.get();
    auto [other_read, other_write] = make_pipe();
    const int other_raw = other_read.release();

    read_end.reset(other_raw);
    REQUIRE_FALSE(is_open(old_raw));
    REQUIRE(read_end.get() == other_raw);

    const int write_raw = write_end.get();
    REQUIRE(write_end.close());
    REQUIRE_FALSE(write_end.valid());
    REQUIRE_FALSE(is_open(write_raw));
}

TEST_CASE("UniqueFd release hands over ownership", "[unique_fd]") {
    auto [read_end, write_end] = make_pipe();
    const int raw = write_end.release();
    REQUIRE_FALSE(write_end.valid());
    REQUIRE(is_open(raw));
    ::close(raw);
}
