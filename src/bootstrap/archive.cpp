#include "archive.hpp"

#include <util/logging.hpp>
#include <util/unique_fd.hpp>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <lzma.h>
#include <optional>
#include <string>
#include <string_view>
#include <sys/stat.h>
#include <unistd.h>
#include <unordered_set>
#include <vector>

namespace polarbear::bootstrap {

namespace {

constexpr size_t BLOCK_SIZE = 512;
constexpr size_t INPUT_CHUNK = 64 * 1024;
constexpr size_t COPY_CHUNK = 256 * 1024;
constexpr uint64_t PROGRESS_STEP = 1024 * 1024;
// Metadata entries (long names, pax headers) larger than this are rejected.
constexpr uint64_t MAX_META_SIZE = 1024 * 1024;

auto io_error(int err, const std::string& what) -> Error {
    const ErrorCode code = err == ENOSPC ? ErrorCode::disk_full : ErrorCode::file_write_failed;
    return Error{code, what + ": " + std::strerror(err)};
}

// =============================================================================
// xz stream
// =============================================================================

class XzReader {
public:
    XzReader() = default;
    ~XzReader() { lzma_end(&m_stream); }

    XzReader(const XzReader&) = delete;
    XzReader& operator=(const XzReader&) = delete;
    XzReader(XzReader&&) = delete;
    XzReader& operator=(XzReader&&) = delete;

    [[nodiscard]] auto open(const std::filesystem::path& path) -> Result<void> {
        m_fd = util::UniqueFd(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
        if (!m_fd.valid()) {
            const ErrorCode code = errno == ENOENT ? ErrorCode::file_not_found
                                                   : ErrorCode::file_read_failed;
            return make_error<void>(code,
                                    "Cannot open " + path.string() + ": " + std::strerror(errno));
        }
        struct stat st {};
        if (::fstat(m_fd.get(), &st) == 0) {
            m_total = static_cast<uint64_t>(st.st_size);
        }
        const lzma_ret ret = lzma_stream_decoder(&m_stream, UINT64_MAX, LZMA_CONCATENATED);
        if (ret != LZMA_OK) {
            return make_error<void>(ErrorCode::unknown_error,
                                    "lzma decoder init failed (" + std::to_string(ret) + ")");
        }
        return {};
    }

    /// Fills @p out completely. Returns false on a clean end of stream before any byte.
    [[nodiscard]] auto read_exact(uint8_t* out, size_t size) -> Result<bool> {
        size_t filled = 0;
        while (filled < size) {
            const size_t n = POLARBEAR_TRY(read_some(out + filled, size - filled));
            if (n == 0) {
                if (filled == 0) {
                    return false;
                }
                return make_error<bool>(ErrorCode::corrupt_archive, "Archive truncated");
            }
            filled += n;
        }
        return true;
    }

    [[nodiscard]] auto consumed() const -> uint64_t { return m_consumed; }
    [[nodiscard]] auto total() const -> uint64_t { return m_total; }

private:
    [[nodiscard]] auto read_some(uint8_t* out, size_t size) -> Result<size_t> {
        if (m_finished) {
            return size_t{0};
        }
        m_stream.next_out = out;
        m_stream.avail_out = size;
        while (m_stream.avail_out == size) {
            if (m_stream.avail_in == 0 && !m_input_eof) {
                const ssize_t n = ::read(m_fd.get(), m_input.data(), m_input.size());
                if (n < 0) {
                    if (errno == EINTR) {
                        continue;
                    }
                    return make_error<size_t>(ErrorCode::file_read_failed,
                                              std::string("Archive read failed: ") +
                                                  std::strerror(errno));
                }
                m_consumed += static_cast<uint64_t>(n);
                m_input_eof = n == 0;
                m_stream.next_in = m_input.data();
                m_stream.avail_in = static_cast<size_t>(n);
            }
            const lzma_ret ret = lzma_code(&m_stream, m_input_eof ? LZMA_FINISH : LZMA_RUN);
            if (ret == LZMA_STREAM_END) {
                m_finished = true;
                break;
            }
            if (ret != LZMA_OK) {
                return make_error<size_t>(ErrorCode::corrupt_archive, describe(ret));
            }
        }
        return size - m_stream.avail_out;
    }

    static auto describe(lzma_ret ret) -> std::string {
        switch (ret) {
        case LZMA_FORMAT_ERROR:
            return "Archive is not xz-compressed";
        case LZMA_DATA_ERROR:
            return "Compressed data is corrupt";
        case LZMA_BUF_ERROR:
            return "Compressed data is truncated";
        case LZMA_MEM_ERROR:
            return "Out of memory while decompressing";
        default:
            return "xz decoder error " + std::to_string(ret);
        }
    }

    util::UniqueFd m_fd;
    lzma_stream m_stream = LZMA_STREAM_INIT;
    std::array<uint8_t, INPUT_CHUNK> m_input{};
    bool m_input_eof = false;
    bool m_finished = false;
    uint64_t m_consumed = 0;
    uint64_t m_total = 0;
};

// =============================================================================
// tar headers
// =============================================================================

struct Header {
    std::string name;
    std::string linkname;
    uint32_t mode = 0;
    uint64_t size = 0;
    char type = '0';
};

/// Pax and GNU metadata that applies to the next real entry.
struct PendingMeta {
    std::optional<std::string> path;
    std::optional<std::string> linkpath;
    std::optional<uint64_t> size;
};

auto field(const uint8_t* block, size_t offset, size_t length) -> std::string {
    const auto* begin = reinterpret_cast<const char*>(block + offset);
    const auto* end = std::find(begin, begin + length, '\0');
    return {begin, end};
}

auto parse_number(const uint8_t* block, size_t offset, size_t length) -> std::optional<uint64_t> {
    const uint8_t* p = block + offset;
    if ((p[0] & 0x80U) != 0) {
        // GNU base-256: big-endian binary after the marker bit.
        uint64_t value = p[0] & 0x7FU;
        for (size_t i = 1; i < length; ++i) {
            if (value > (UINT64_MAX >> 8)) {
                return std::nullopt;
            }
            value = (value << 8) | p[i];
        }
        return value;
    }
    uint64_t value = 0;
    size_t i = 0;
    while (i < length && (p[i] == ' ' || p[i] == '\0')) {
        ++i;
    }
    for (; i < length && p[i] >= '0' && p[i] <= '7'; ++i) {
        value = (value << 3) | static_cast<uint64_t>(p[i] - '0');
    }
    for (; i < length; ++i) {
        if (p[i] != ' ' && p[i] != '\0') {
            return std::nullopt;
        }
    }
    return value;
}

auto is_zero_block(const std::array<uint8_t, BLOCK_SIZE>& block) -> bool {
    return std::ranges::all_of(block, [](uint8_t b) { return b == 0; });
}

auto parse_header(const std::array<uint8_t, BLOCK_SIZE>& block) -> Result<Header> {
    const auto stored = parse_number(block.data(), 148, 8);
    uint64_t sum = 0;
    for (size_t i = 0; i < BLOCK_SIZE; ++i) {
        sum += (i >= 148 && i < 156) ? static_cast<uint8_t>(' ') : block[i];
    }
    if (!stored || *stored != sum) {
        return make_error<Header>(ErrorCode::corrupt_archive, "Tar header checksum mismatch");
    }

    Header header;
    header.name = field(block.data(), 0, 100);
    header.linkname = field(block.data(), 157, 100);
    header.type = static_cast<char>(block[156]);

    const auto mode = parse_number(block.data(), 100, 8);
    const auto size = parse_number(block.data(), 124, 12);
    if (!mode || !size) {
        return make_error<Header>(ErrorCode::corrupt_archive, "Malformed tar numeric field");
    }
    header.mode = static_cast<uint32_t>(*mode & 07777U);
    header.size = *size;

    if (std::memcmp(block.data() + 257, "ustar", 5) == 0) {
        auto prefix = field(block.data(), 345, 155);
        if (!prefix.empty()) {
            header.name = prefix + "/" + header.name;
        }
    }
    return header;
}

/// Plain decimal, rejecting anything that does not fit in 64 bits.
auto parse_decimal(std::string_view text) -> std::optional<uint64_t> {
    if (text.empty()) {
        return std::nullopt;
    }
    uint64_t value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        const auto digit = static_cast<uint64_t>(c - '0');
        if (value > (UINT64_MAX - digit) / 10) {
            return std::nullopt;
        }
        value = value * 10 + digit;
    }
    return value;
}

/// Records are `<len> <key>=<value>\n`, where len counts the whole record.
auto parse_pax(std::string_view data, PendingMeta& meta) -> Result<void> {
    while (!data.empty()) {
        const size_t space = data.find(' ');
        if (space == std::string_view::npos || space == 0) {
            return make_error<void>(ErrorCode::corrupt_archive, "Malformed pax record");
        }
        const auto parsed_length = parse_decimal(data.substr(0, space));
        if (!parsed_length) {
            return make_error<void>(ErrorCode::corrupt_archive, "Malformed pax length");
        }
        if (*parsed_length > data.size()) {
            return make_error<void>(ErrorCode::corrupt_archive, "Pax record length out of range");
        }
        const auto length = static_cast<size_t>(*parsed_length);
        if (length <= space + 1 || data[length - 1] != '\n') {
            return make_error<void>(ErrorCode::corrupt_archive, "Pax record length out of range");
        }
        const auto record = data.substr(space + 1, length - space - 2);
        const size_t eq = record.find('=');
        if (eq != std::string_view::npos) {
            const auto key = record.substr(0, eq);
            const auto value = record.substr(eq + 1);
            if (key == "path") {
                meta.path = std::string(value);
            } else if (key == "linkpath") {
                meta.linkpath = std::string(value);
            } else if (key == "size") {
                meta.size = parse_decimal(value);
                if (!meta.size) {
                    return make_error<void>(ErrorCode::corrupt_archive,
                                            "Malformed pax size: " + std::string(value));
                }
            }
        }
        data.remove_prefix(length);
    }
    return {};
}

/// Normalizes an entry path and drops @p strip leading components.
/// Returns an empty path when nothing is left.
auto sanitize(const std::string& raw, uint32_t strip) -> Result<std::filesystem::path> {
    if (!raw.empty() && raw.front() == '/') {
        return make_error<std::filesystem::path>(ErrorCode::corrupt_archive,
                                                 "Absolute path in archive: " + raw);
    }
    std::vector<std::string_view> parts;
    std::string_view rest(raw);
    while (!rest.empty()) {
        const size_t slash = rest.find('/');
        const auto part = rest.substr(0, slash);
        rest = slash == std::string_view::npos ? std::string_view{} : rest.substr(slash + 1);
        if (part.empty() || part == ".") {
            continue;
        }
        if (part == "..") {
            return make_error<std::filesystem::path>(ErrorCode::corrupt_archive,
                                                     "Parent reference in archive path: " + raw);
        }
        parts.push_back(part);
    }
    std::filesystem::path result;
    for (size_t i = strip; i < parts.size(); ++i) {
        result /= std::string(parts[i]);
    }
    return result;
}

// =============================================================================
// Extraction
// =============================================================================

class TarExtractor {
public:
    TarExtractor(XzReader& reader, std::filesystem::path dest, const ExtractOptions& options,
                 const ExtractProgress& progress, std::stop_token stop)
        : m_reader(reader), m_dest(std::move(dest)), m_options(options), m_progress(progress),
          m_stop(std::move(stop)) {}

    [[nodiscard]] auto run() -> Result<ExtractStats> {
        std::array<uint8_t, BLOCK_SIZE> block{};
        PendingMeta meta;
        while (true) {
            POLARBEAR_TRY(check_stop());
            if (!POLARBEAR_TRY(m_reader.read_exact(block.data(), block.size()))) {
                break;
            }
            if (is_zero_block(block)) {
                break;
            }
            auto header = POLARBEAR_TRY(parse_header(block));
            switch (header.type) {
            case 'L':
                meta.path = POLARBEAR_TRY(read_meta(header.size));
                continue;
            case 'K':
                meta.linkpath = POLARBEAR_TRY(read_meta(header.size));
                continue;
            case 'x': {
                const auto data = POLARBEAR_TRY(read_meta(header.size));
                POLARBEAR_TRY(parse_pax(data, meta));
                continue;
            }
            case 'g':
                POLARBEAR_TRY(skip_data(header.size));
                continue;
            default:
                break;
            }

            if (meta.path) {
                header.name = *meta.path;
            }
            if (meta.linkpath) {
                header.linkname = *meta.linkpath;
            }
            if (meta.size) {
                header.size = *meta.size;
            }
            meta = PendingMeta{};
            POLARBEAR_TRY(extract_entry(header));
            report_progress(false);
        }
        POLARBEAR_TRY(apply_directory_modes());
        report_progress(true);
        return m_stats;
    }

private:
    [[nodiscard]] auto check_stop() const -> Result<void> {
        if (m_stop.stop_requested()) {
            return make_error<void>(ErrorCode::cancelled, "Extraction cancelled");
        }
        return {};
    }

    void report_progress(bool force) {
        if (!m_progress) {
            return;
        }
        const uint64_t consumed = m_reader.consumed();
        if (force || consumed >= m_last_reported + PROGRESS_STEP) {
            m_last_reported = consumed;
            m_progress(consumed, m_reader.total());
        }
    }

    [[nodiscard]] auto read_meta(uint64_t size) -> Result<std::string> {
        if (size > MAX_META_SIZE) {
            return make_error<std::string>(ErrorCode::corrupt_archive, "Oversized tar metadata");
        }
        std::string data(size, '\0');
        if (size > 0 &&
            !POLARBEAR_TRY(m_reader.read_exact(reinterpret_cast<uint8_t*>(data.data()), size))) {
            return make_error<std::string>(ErrorCode::corrupt_archive, "Archive truncated");
        }
        POLARBEAR_TRY(skip_padding(size));
        // GNU long names carry a trailing NUL.
        data.erase(std::find(data.begin(), data.end(), '\0'), data.end());
        return data;
    }

    [[nodiscard]] auto skip_padding(uint64_t size) -> Result<void> {
        const uint64_t padding = (BLOCK_SIZE - size % BLOCK_SIZE) % BLOCK_SIZE;
        if (padding == 0) {
            return {};
        }
        std::array<uint8_t, BLOCK_SIZE> scratch{};
        if (!POLARBEAR_TRY(m_reader.read_exact(scratch.data(), padding))) {
            return make_error<void>(ErrorCode::corrupt_archive, "Archive truncated");
        }
        return {};
    }

    [[nodiscard]] auto skip_data(uint64_t size) -> Result<void> {
        return copy_data(size, -1, {});
    }

    /// Reads @p size data bytes plus padding, writing them to @p fd when it is valid.
    [[nodiscard]] auto copy_data(uint64_t size, int fd, const std::filesystem::path& target)
        -> Result<void> {
        uint64_t remaining = size;
        while (remaining > 0) {
            POLARBEAR_TRY(check_stop());
            const size_t chunk = static_cast<size_t>(std::min<uint64_t>(remaining, COPY_CHUNK));
            if (!POLARBEAR_TRY(m_reader.read_exact(m_buffer.data(), chunk))) {
                return make_error<void>(ErrorCode::corrupt_archive, "Archive truncated");
            }
            if (fd >= 0) {
                size_t written = 0;
                while (written < chunk) {
                    const ssize_t n = ::write(fd, m_buffer.data() + written, chunk - written);
                    if (n < 0) {
                        if (errno == EINTR) {
                            continue;
                        }
                        return nonstd::make_unexpected(io_error(errno, "Write " + target.string()));
                    }
                    written += static_cast<size_t>(n);
                }
            }
            remaining -= chunk;
            report_progress(false);
        }
        return skip_padding(size);
    }

    /// Rejects entries whose parent directories include a symlink. Missing directories are
    /// created, or with @p create false the walk stops at the first one.
    [[nodiscard]] auto prepare_parent(const std::filesystem::path& rel, bool create = true)
        -> Result<void> {
        std::filesystem::path current = m_dest;
        for (const auto& part : rel.parent_path()) {
            current /= part;
            if (m_safe_dirs.contains(current.string())) {
                continue;
            }
            struct stat st {};
            const bool exists = ::lstat(current.c_str(), &st) == 0;
            if (!exists && !create) {
                return {};
            }
            if (exists) {
                if (S_ISLNK(st.st_mode)) {
                    return make_error<void>(ErrorCode::corrupt_archive,
                                            "Archive entry escapes through symlink: " +
                                                rel.string());
                }
                if (!S_ISDIR(st.st_mode)) {
                    return make_error<void>(ErrorCode::corrupt_archive,
                                            "Archive entry parent is not a directory: " +
                                                rel.string());
                }
            } else if (::mkdir(current.c_str(), 0755) != 0 && errno != EEXIST) {
                return nonstd::make_unexpected(io_error(errno, "mkdir " + current.string()));
            }
            m_safe_dirs.insert(current.string());
        }
        return {};
    }

    /// Removes a non-directory at @p target so it can be replaced.
    [[nodiscard]] static auto remove_existing(const std::filesystem::path& target)
        -> Result<void> {
        struct stat st {};
        if (::lstat(target.c_str(), &st) != 0) {
            return {};
        }
        if (S_ISDIR(st.st_mode)) {
            return make_error<void>(ErrorCode::corrupt_archive,
                                    "Archive replaces a directory with a file: " +
                                        target.string());
        }
        if (::unlink(target.c_str()) != 0) {
            return nonstd::make_unexpected(io_error(errno, "unlink " + target.string()));
        }
        return {};
    }

    [[nodiscard]] auto extract_entry(const Header& header) -> Result<void> {
        const auto rel = POLARBEAR_TRY(sanitize(header.name, m_options.strip_components));
        if (rel.empty()) {
            ++m_stats.skipped;
            return skip_data(header.size);
        }
        const auto target = m_dest / rel;

        switch (header.type) {
        case '0':
        case '\0':
        case '7':
            return extract_file(header, rel, target);
        case '5': {
            POLARBEAR_TRY(prepare_parent(rel));
            struct stat st {};
            if (::lstat(target.c_str(), &st) == 0 && !S_ISDIR(st.st_mode)) {
                POLARBEAR_TRY(remove_existing(target));
            }
            if (::mkdir(target.c_str(), 0755) != 0 && errno != EEXIST) {
                return nonstd::make_unexpected(io_error(errno, "mkdir " + target.string()));
            }
            m_safe_dirs.insert(target.string());
            m_dir_modes.emplace_back(target, header.mode);
            ++m_stats.directories;
            return skip_data(header.size);
        }
        case '2':
            POLARBEAR_TRY(prepare_parent(rel));
            POLARBEAR_TRY(remove_existing(target));
            if (::symlink(header.linkname.c_str(), target.c_str()) != 0) {
                return nonstd::make_unexpected(io_error(errno, "symlink " + target.string()));
            }
            ++m_stats.symlinks;
            return skip_data(header.size);
        case '1': {
            const auto link_rel =
                POLARBEAR_TRY(sanitize(header.linkname, m_options.strip_components));
            if (link_rel.empty()) {
                ++m_stats.skipped;
                return skip_data(header.size);
            }
            // The source is resolved inside the tree too; a symlinked parent would link an
            // outside file in.
            POLARBEAR_TRY(prepare_parent(link_rel, false));
            POLARBEAR_TRY(prepare_parent(rel));
            POLARBEAR_TRY(remove_existing(target));
            const auto source = m_dest / link_rel;
            if (::linkat(AT_FDCWD, source.c_str(), AT_FDCWD, target.c_str(), 0) != 0) {
                return nonstd::make_unexpected(io_error(errno, "link " + target.string()));
            }
            ++m_stats.hardlinks;
            return skip_data(header.size);
        }
        default:
            POLARBEAR_LOG_DEBUG("Skipping tar entry '{}' of type '{}'", header.name, header.type);
            ++m_stats.skipped;
            return skip_data(header.size);
        }
    }

    [[nodiscard]] auto extract_file(const Header& header, const std::filesystem::path& rel,
                                    const std::filesystem::path& target) -> Result<void> {
        POLARBEAR_TRY(prepare_parent(rel));
        POLARBEAR_TRY(remove_existing(target));
        util::UniqueFd fd(::open(target.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC | O_NOFOLLOW,
                                 0600));
        if (!fd.valid()) {
            return nonstd::make_unexpected(io_error(errno, "create " + target.string()));
        }
        POLARBEAR_TRY(copy_data(header.size, fd.get(), target));
        if (::fchmod(fd.get(), header.mode) != 0) {
            return nonstd::make_unexpected(io_error(errno, "chmod " + target.string()));
        }
        if (!fd.close()) {
            return nonstd::make_unexpected(io_error(errno, "close " + target.string()));
        }
        ++m_stats.files;
        return {};
    }

    [[nodiscard]] auto apply_directory_modes() -> Result<void> {
        // Deepest first so a read-only parent does not block its children.
        for (auto it = m_dir_modes.rbegin(); it != m_dir_modes.rend(); ++it) {
            if (::chmod(it->first.c_str(), it->second) != 0) {
                return nonstd::make_unexpected(io_error(errno, "chmod " + it->first.string()));
            }
        }
        return {};
    }

    XzReader& m_reader;
    std::filesystem::path m_dest;
    const ExtractOptions& m_options;
    const ExtractProgress& m_progress;
    std::stop_token m_stop;

    std::vector<uint8_t> m_buffer = std::vector<uint8_t>(COPY_CHUNK);
    std::unordered_set<std::string> m_safe_dirs;
    std::vector<std::pair<std::filesystem::path, uint32_t>> m_dir_modes;
    ExtractStats m_stats;
    uint64_t m_last_reported = 0;
};

} // namespace

auto extract_tar_xz(const std::filesystem::path& archive, const std::filesystem::path& dest,
                    const ExtractOptions& options, const ExtractProgress& progress,
                    std::stop_token stop) -> Result<ExtractStats> {
    std::error_code ec;
    std::filesystem::create_directories(dest, ec);
    if (ec) {
        return nonstd::make_unexpected(io_error(ec.value(), "create " + dest.string()));
    }

    XzReader reader;
    POLARBEAR_TRY(reader.open(archive));
    TarExtractor extractor(reader, dest, options, progress, std::move(stop));
    auto stats = POLARBEAR_TRY(extractor.run());
    POLARBEAR_LOG_INFO("Extracted {} files, {} dirs, {} symlinks, {} hardlinks ({} skipped)",
                       stats.files, stats.directories, stats.symlinks, stats.hardlinks,
                       stats.skipped);
    return stats;
}

} // namespace polarbear::bootstrap
