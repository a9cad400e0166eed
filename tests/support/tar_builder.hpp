#pragma once

#include <algorithm>
#include <array>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <lzma.h>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace polarbear::test {

/// In-memory ustar writer for extraction tests; `write_xz()` compresses it with liblzma.
class TarBuilder {
public:
    auto file(std::string_view name, std::string_view contents, uint32_t mode = 0644)
        -> TarBuilder& {
        append_header(name, '0', contents.size(), mode, {});
        append_data(contents);
        return *this;
    }

    auto directory(std::string_view name, uint32_t mode = 0755) -> TarBuilder& {
        append_header(name, '5', 0, mode, {});
        return *this;
    }

    auto symlink(std::string_view name, std::string_view target) -> TarBuilder& {
        append_header(name, '2', 0, 0777, target);
        return *this;
    }

    auto hardlink(std::string_view name, std::string_view target) -> TarBuilder& {
        append_header(name, '1', 0, 0644, target);
        return *this;
    }

    auto fifo(std::string_view name) -> TarBuilder& {
        append_header(name, '6', 0, 0644, {});
        return *this;
    }

    /// Pax header overriding the path of the following entry.
    auto pax_path(std::string_view path) -> TarBuilder& { return pax_record("path", path); }

    /// Pax header carrying one `key=value` record for the following entry.
    auto pax_record(std::string_view key, std::string_view value) -> TarBuilder& {
        const std::string body = std::string(key) + "=" + std::string(value) + "\n";
        // The length prefix counts itself.
        size_t length = body.size() + 2;
        while (std::to_string(length).size() + 1 + body.size() != length) {
            ++length;
        }
        const std::string record = std::to_string(length) + " " + body;
        append_header("PaxHeaders/entry", 'x', record.size(), 0644, {});
        append_data(record);
        return *this;
    }

    /// GNU long name entry for the following entry.
    auto gnu_long_name(std::string_view path) -> TarBuilder& {
        std::string data(path);
        data.push_back('\0');
        append_header("././@LongLink", 'L', data.size(), 0644, {});
        append_data(data);
        return *this;
    }

    /// Raw header block with a deliberately wrong checksum.
    auto corrupt_header() -> TarBuilder& {
        std::array<char, 512> block{};
        std::memcpy(block.data(), "broken", 6);
        std::memcpy(block.data() + 148, "0000001", 7);
        m_data.insert(m_data.end(), block.begin(), block.end());
        return *this;
    }

    [[nodiscard]] auto tar() const -> std::vector<uint8_t> {
        std::vector<uint8_t> out = m_data;
        out.resize(out.size() + 1024, 0);
        return out;
    }

    void write_xz(const std::filesystem::path& path) const {
        const auto raw = tar();
        std::vector<uint8_t> compressed(lzma_stream_buffer_bound(raw.size()));
        size_t out_pos = 0;
        const lzma_ret ret =
            lzma_easy_buffer_encode(1, LZMA_CHECK_CRC64, nullptr, raw.data(), raw.size(),
                                    compressed.data(), &out_pos, compressed.size());
        if (ret != LZMA_OK) {
            throw std::runtime_error("lzma_easy_buffer_encode failed");
        }
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out.write(reinterpret_cast<const char*>(compressed.data()),
                  static_cast<std::streamsize>(out_pos));
    }

private:
    void append_header(std::string_view name, char type, uint64_t size, uint32_t mode,
                       std::string_view linkname) {
        std::array<char, 512> block{};
        std::memcpy(block.data(), name.data(), std::min<size_t>(name.size(), 100));
        std::snprintf(block.data() + 100, 8, "%07o", mode);
        std::snprintf(block.data() + 108, 8, "%07o", 0U);
        std::snprintf(block.data() + 116, 8, "%07o", 0U);
        std::snprintf(block.data() + 124, 12, "%011llo", static_cast<unsigned long long>(size));
        std::snprintf(block.data() + 136, 12, "%011o", 0U);
        block[156] = type;
        std::memcpy(block.data() + 157, linkname.data(), std::min<size_t>(linkname.size(), 100));
        std::memcpy(block.data() + 257, "ustar", 6);
        std::memcpy(block.data() + 263, "00", 2);

        std::memset(block.data() + 148, ' ', 8);
        unsigned int sum = 0;
        for (char c : block) {
            sum += static_cast<unsigned char>(c);
        }
        std::snprintf(block.data() + 148, 8, "%06o", sum);
        block[155] = ' ';
        m_data.insert(m_data.end(), block.begin(), block.end());
    }

    void append_data(std::string_view contents) {
        m_data.insert(m_data.end(), contents.begin(), contents.end());
        const size_t padding = (512 - contents.size() % 512) % 512;
        m_data.resize(m_data.size() + padding, 0);
    }

    std::vector<uint8_t> m_data;
};

} // namespace polarbear::test
