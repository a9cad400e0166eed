#include "guest_setup.hpp"

#include <util/logging.hpp>

#include <array>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sys/stat.h>

namespace polarbear::bootstrap {

namespace {

constexpr std::array FAKE_PROC_FILES = {
    FakeProcFile{".loadavg", "0.12 0.07 0.02 2/165 765\n"},
    FakeProcFile{".stat", "cpu  1957 0 2877 93280 262 342 254 87 0 0\n"
                          "cpu0 31 0 226 12027 82 10 4 9 0 0\n"},
    FakeProcFile{".uptime", "124.08 932.80\n"},
    FakeProcFile{".version",
                 "Linux version 6.2.1 (proot@termux) (gcc (GCC) 12.2.1 20230201, GNU ld (GNU "
                 "Binutils) 2.40) #1 SMP PREEMPT_DYNAMIC Wed, 01 Mar 2023 00:00:00 +0000\n"},
    FakeProcFile{".vmstat", "nr_free_pages 1743136\nnr_zone_inactive_anon 179281\n"
                            "nr_zone_active_anon 7183\n"},
    FakeProcFile{".sysctl_entry_cap_last_cap", "40\n"},
    FakeProcFile{".sysctl_inotify_max_user_watches", "4096\n"},
};

auto make_dir(const std::filesystem::path& path, mode_t mode) -> Result<void> {
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    if (ec) {
        return make_error<void>(ec.value() == ENOSPC ? ErrorCode::disk_full
                                                     : ErrorCode::file_write_failed,
                                "Cannot create " + path.string() + ": " + ec.message());
    }
    if (::chmod(path.c_str(), mode) != 0) {
        return make_error<void>(ErrorCode::file_write_failed,
                                "chmod " + path.string() + ": " + std::strerror(errno));
    }
    return {};
}

} // namespace

auto fake_proc_files() -> std::span<const FakeProcFile> {
    return FAKE_PROC_FILES;
}

auto write_fake_sysdata(const std::filesystem::path& rootfs) -> Result<void> {
    POLARBEAR_TRY(make_dir(rootfs / "proc", 0700));
    POLARBEAR_TRY(make_dir(rootfs / "sys" / ".empty", 0700));

    for (const auto& file : FAKE_PROC_FILES) {
        const auto path = rootfs / "proc" / file.name;
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << file.contents;
        out.flush();
        if (!out) {
            return make_error<void>(ErrorCode::file_write_failed,
                                    "Failed to write " + path.string());
        }
    }
    return {};
}

auto fix_xkb_symlink(const std::filesystem::path& rootfs) -> Result<void> {
    const auto link = rootfs / "usr/share/X11/xkb";
    std::error_code ec;
    if (!std::filesystem::is_symlink(std::filesystem::symlink_status(link, ec))) {
        return {};
    }
    const auto target = std::filesystem::read_symlink(link, ec);
    if (ec) {
        return make_error<void>(ErrorCode::file_read_failed,
                                "readlink " + link.string() + ": " + ec.message());
    }
    if (!target.is_absolute()) {
        return {};
    }

    const auto relative = target.lexically_relative("/usr/share/X11");
    POLARBEAR_LOG_INFO("Rewriting xkb symlink {} -> {}", target.string(), relative.string());
    std::filesystem::remove(link, ec);
    if (ec) {
        return make_error<void>(ErrorCode::file_write_failed,
                                "remove " + link.string() + ": " + ec.message());
    }
    std::filesystem::create_symlink(relative, link, ec);
    if (ec) {
        return make_error<void>(ErrorCode::file_write_failed,
                                "symlink " + link.string() + ": " + ec.message());
    }
    return {};
}

auto create_socket_dirs(const std::filesystem::path& rootfs) -> Result<void> {
    POLARBEAR_TRY(make_dir(rootfs / "tmp", 01777));
    POLARBEAR_TRY(make_dir(rootfs / "tmp" / ".X11-unix", 01777));
    return {};
}

auto run_guest_setup(const std::filesystem::path& rootfs) -> Result<void> {
    POLARBEAR_TRY(write_fake_sysdata(rootfs));
    POLARBEAR_TRY(fix_xkb_symlink(rootfs));
    POLARBEAR_TRY(create_socket_dirs(rootfs));
    POLARBEAR_LOG_DEBUG("Guest setup hooks applied to {}", rootfs.string());
    return {};
}

} // namespace polarbear::bootstrap
