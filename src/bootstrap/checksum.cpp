#include "checksum.hpp"

#include <util/unique_fd.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <memory>
#include <openssl/evp.h>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

namespace polarbear::bootstrap {

namespace {

constexpr size_t CHUNK_SIZE = 1024 * 1024;

auto to_hex(const unsigned char* data, unsigned int len) -> std::string {
    static constexpr char DIGITS[] = "0123456789abcdef";
    std::string out;
    out.reserve(static_cast<size_t>(len) * 2);
    for (unsigned int i = 0; i < len; ++i) {
        out.push_back(DIGITS[data[i] >> 4]);
        out.push_back(DIGITS[data[i] & 0x0F]);
    }
    return out;
}

} // namespace

auto sha256_file(const std::filesystem::path& path, std::stop_token stop,
                 const HashProgress& progress) -> Result<std::string> {
    util::UniqueFd fd(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
    if (!fd.valid()) {
        const ErrorCode code = errno == ENOENT ? ErrorCode::file_not_found
                                               : ErrorCode::file_read_failed;
        return make_error<std::string>(code, "Cannot open " + path.string() + ": " +
                                                 std::strerror(errno));
    }
    struct stat st {};
    const uint64_t total = ::fstat(fd.get(), &st) == 0 ? static_cast<uint64_t>(st.st_size) : 0;

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(),
                                                                &EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        return make_error<std::string>(ErrorCode::unknown_error, "EVP SHA-256 init failed");
    }

    std::vector<unsigned char> buffer(CHUNK_SIZE);
    uint64_t hashed = 0;
    while (true) {
        if (stop.stop_requested()) {
            return make_error<std::string>(ErrorCode::cancelled, "Verification cancelled");
        }
        const ssize_t n = ::read(fd.get(), buffer.data(), buffer.size());
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return make_error<std::string>(ErrorCode::file_read_failed,
                                           "Read " + path.string() + ": " + std::strerror(errno));
        }
        if (n == 0) {
            break;
        }
        if (EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<size_t>(n)) != 1) {
            return make_error<std::string>(ErrorCode::unknown_error, "EVP SHA-256 update failed");
        }
        hashed += static_cast<uint64_t>(n);
        if (progress) {
            progress(hashed, total);
        }
    }

    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int digest_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest.data(), &digest_len) != 1) {
        return make_error<std::string>(ErrorCode::unknown_error, "EVP SHA-256 final failed");
    }
    return to_hex(digest.data(), digest_len);
}

auto verify_sha256(const std::filesystem::path& path, const std::string& expected_hex,
                   std::stop_token stop, const HashProgress& progress) -> Result<void> {
    auto actual = POLARBEAR_TRY(sha256_file(path, stop, progress));
    std::string expected = expected_hex;
    std::ranges::transform(expected, expected.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (actual != expected) {
        return make_error<void>(ErrorCode::integrity_mismatch,
                                "SHA-256 mismatch for " + path.filename().string() +
                                    ": expected " + expected + ", got " + actual);
    }
    return {};
}

} // namespace polarbear::bootstrap
