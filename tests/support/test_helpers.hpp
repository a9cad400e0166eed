#pragma once

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <string_view>
#include <unistd.h>
#include <vector>

namespace polarbear::test {

class EnvVarGuard {
public:
    EnvVarGuard(std::string key, std::optional<std::string> value) : m_key(std::move(key)) {
        const char* prev = std::getenv(m_key.c_str());
        if (prev != nullptr) {
            m_prev = std::string(prev);
        }

        if (value.has_value()) {
            setenv(m_key.c_str(), value->c_str(), 1);
        } else {
            unsetenv(m_key.c_str());
        }
    }

    ~EnvVarGuard() {
        if (m_prev.has_value()) {
            setenv(m_key.c_str(), m_prev->c_str(), 1);
        } else {
            unsetenv(m_key.c_str());
        }
    }

    EnvVarGuard(const EnvVarGuard&) = delete;
    EnvVarGuard& operator=(const EnvVarGuard&) = delete;
    EnvVarGuard(EnvVarGuard&&) = delete;
    EnvVarGuard& operator=(EnvVarGuard&&) = delete;

private:
    std::string m_key;
    std::optional<std::string> m_prev;
};

/// Unique directory under the system temp dir, removed recursively on destruction.
class TempDir {
public:
    explicit TempDir(std::string_view name_prefix) {
        auto base = std::filesystem::temp_directory_path();
        auto tmpl = (base / (std::string(name_prefix) + "-XXXXXX")).string();

        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');

        char* dir = mkdtemp(buf.data());
        if (dir == nullptr) {
            m_path = base / (std::string(name_prefix) + "-" + std::to_string(::getpid()));
            std::error_code ec;
            std::filesystem::create_directories(m_path, ec);
            return;
        }
        m_path = std::filesystem::path(dir);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return m_path; }
    [[nodiscard]] auto operator/(const std::filesystem::path& rel) const -> std::filesystem::path {
        return m_path / rel;
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;
    TempDir(TempDir&&) = delete;
    TempDir& operator=(TempDir&&) = delete;

private:
    std::filesystem::path m_path;
};

inline void write_file(const std::filesystem::path& path, std::string_view contents) {
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
}

inline auto read_file(const std::filesystem::path& path) -> std::string {
    std::ifstream in(path, std::ios::binary);
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

} // namespace polarbear::test
