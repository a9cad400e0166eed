#include "guest_config.hpp"

#include <util/logging.hpp>

#include <fstream>
#include <map>
#include <optional>
#include <sstream>
#include <toml.hpp>
#include <utility>
#include <vector>

namespace polarbear::supervisor {

namespace {

constexpr std::string_view TRY_PREFIX = "try_";

auto trim(std::string_view s) -> std::string_view {
    const auto begin = s.find_first_not_of(" \t\r");
    if (begin == std::string_view::npos) {
        return {};
    }
    const auto end = s.find_last_not_of(" \t\r");
    return s.substr(begin, end - begin + 1);
}

auto section_of(std::string_view line) -> std::optional<std::string> {
    if (line.size() >= 2 && line.front() == '[' && line.back() == ']') {
        return std::string(trim(line.substr(1, line.size() - 2)));
    }
    return std::nullopt;
}

struct KeyValue {
    std::string key;
    std::string value;
};

auto split_key_value(std::string_view line) -> std::optional<KeyValue> {
    if (line.empty() || line.front() == '#') {
        return std::nullopt;
    }
    const auto eq = line.find('=');
    if (eq == std::string_view::npos) {
        return std::nullopt;
    }
    return KeyValue{std::string(trim(line.substr(0, eq))), std::string(trim(line.substr(eq + 1)))};
}

auto read_string(const toml::value& data, const char* table, const char* key, std::string& out) {
    if (!data.contains(table)) {
        return;
    }
    const auto& section = toml::find(data, table);
    if (section.is_table() && section.contains(key)) {
        out = toml::find<std::string>(section, key);
    }
}

} // namespace

auto default_guest_config() -> GuestConfig {
    return GuestConfig{
        .username = "root",
        .check = "pacman -Qg lxqt && pacman -Q xorg-xwayland && pacman -Q lxqt-wayland-session && "
                 "pacman -Q labwc && pacman -Q breeze-icons && pacman -Q onboard",
        .install = "stdbuf -oL pacman -Syu lxqt xorg-xwayland lxqt-wayland-session labwc "
                   "breeze-icons onboard --noconfirm --noprogressbar",
        .launch = "XDG_SESSION_TYPE=x11 dbus-run-session startlxqt",
        .compat_server = "Xwayland -hidpi :1",
    };
}

auto apply_try_overrides(std::string_view content) -> TryOverrides {
    std::vector<std::string> lines;
    std::istringstream in{std::string(content)};
    for (std::string line; std::getline(in, line);) {
        lines.push_back(std::move(line));
    }

    // First pass: collect overrides per (table, key); the last one wins.
    std::map<std::pair<std::string, std::string>, std::string> overrides;
    std::string section;
    for (const auto& raw : lines) {
        const auto line = trim(raw);
        if (auto header = section_of(line)) {
            section = *header;
            continue;
        }
        if (auto kv = split_key_value(line); kv && kv->key.starts_with(TRY_PREFIX)) {
            overrides[{section, kv->key.substr(TRY_PREFIX.size())}] = kv->value;
        }
    }

    TryOverrides result;
    result.changed = !overrides.empty();
    auto used = overrides;

    auto flush_unused = [&](const std::string& table) {
        for (auto it = used.begin(); it != used.end();) {
            if (it->first.first == table) {
                result.effective += it->first.second + " = " + it->second + "\n";
                it = used.erase(it);
            } else {
                ++it;
            }
        }
    };

    section.clear();
    for (const auto& raw : lines) {
        const auto line = trim(raw);
        if (auto header = section_of(line)) {
            flush_unused(section);
            section = *header;
            result.effective += raw + "\n";
            result.write_back += raw + "\n";
            continue;
        }
        auto kv = split_key_value(line);
        if (kv && kv->key.starts_with(TRY_PREFIX)) {
            result.write_back += "# " + std::string(line) + "\n";
            continue;
        }
        result.write_back += raw + "\n";
        if (kv) {
            auto it = overrides.find({section, kv->key});
            if (it != overrides.end()) {
                result.effective += kv->key + " = " + it->second + "\n";
                used.erase(it->first);
                continue;
            }
        }
        result.effective += raw + "\n";
    }
    flush_unused(section);
    return result;
}

auto load_guest_config(const std::filesystem::path& rootfs) -> GuestConfig {
    const auto path = rootfs / GUEST_CONFIG_PATH;
    GuestConfig config = default_guest_config();

    std::ifstream file(path);
    if (!file) {
        POLARBEAR_LOG_DEBUG("No guest config at {}, using defaults", path.string());
        return config;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    file.close();

    auto processed = apply_try_overrides(buffer.str());
    if (processed.changed) {
        std::ofstream out(path, std::ios::trunc);
        out << processed.write_back;
        out.flush();
        if (!out) {
            POLARBEAR_LOG_WARN("Could not comment out try_ entries in {}", path.string());
        }
    }

    try {
        std::istringstream effective(processed.effective);
        const auto data = toml::parse(effective, path.string());
        read_string(data, "user", "username", config.username);
        read_string(data, "command", "check", config.check);
        read_string(data, "command", "install", config.install);
        read_string(data, "command", "launch", config.launch);
        read_string(data, "command", "compat_server", config.compat_server);
    } catch (const std::exception& e) {
        POLARBEAR_LOG_WARN("Guest config {} is malformed, using defaults: {}", path.string(),
                           e.what());
        return default_guest_config();
    }
    return config;
}

} // namespace polarbear::supervisor
