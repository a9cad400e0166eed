#pragma once

#include <fcntl.h>
#include <optional>
#include <unistd.h>
#include <utility>

namespace polarbear::util {

/// Owning file descriptor. Closes on destruction; `close()` reports the result instead.
class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) : m_fd(fd) {}

    ~UniqueFd() { reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    UniqueFd(UniqueFd&& other) noexcept : m_fd(std::exchange(other.m_fd, -1)) {}

    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) {
            reset(std::exchange(other.m_fd, -1));
        }
        return *this;
    }

    struct Pipe;

    /// Creates a close-on-exec pipe. errno is left set on failure.
    [[nodiscard]] static auto pipe() -> std::optional<Pipe>;

    /// Closes the current descriptor, if any, and takes ownership of @p fd.
    void reset(int fd = -1) {
        if (m_fd >= 0) {
            ::close(m_fd);
        }
        m_fd = fd;
    }

    /// Closes and reports whether close(2) succeeded; errno is left set on failure.
    [[nodiscard]] bool close() { return ::close(std::exchange(m_fd, -1)) == 0; }

    [[nodiscard]] int get() const { return m_fd; }
    int release() { return std::exchange(m_fd, -1); }
    [[nodiscard]] bool valid() const { return m_fd >= 0; }
    explicit operator bool() const { return valid(); }

private:
    int m_fd = -1;
};

struct UniqueFd::Pipe {
    UniqueFd read_end;
    UniqueFd write_end;
};

inline auto UniqueFd::pipe() -> std::optional<Pipe> {
    int fds[2] = {-1, -1};
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        return std::nullopt;
    }
    return Pipe{UniqueFd{fds[0]}, UniqueFd{fds[1]}};
}

} // namespace polarbear::util
