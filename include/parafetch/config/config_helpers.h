#pragma once

#include <parafetch/downloader/downloader.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace parafetch::config {

// String trimming utilities
inline void ltrim(std::string& s) {
    s.erase(s.begin(),
            std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
}

inline void rtrim(std::string& s) {
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); })
                .base(),
            s.end());
}

inline void trim(std::string& s) {
    ltrim(s);
    rtrim(s);
}

// Quote handling
inline std::string unquote(std::string val) {
    trim(val);
    if (val.size() >= 2 && ((val.front() == '"' && val.back() == '"') ||
                            (val.front() == '\'' && val.back() == '\''))) {
        return val.substr(1, val.size() - 2);
    }
    return val;
}

// Tilde expansion ("~" and "~/...")
inline std::filesystem::path expand_tilde(const std::string& path) {
    if (!path.empty() && path[0] == '~' && (path.size() == 1 || path[1] == '/')) {
        const char* home = std::getenv("HOME");
        if (home) {
            return path.size() > 2 ? std::filesystem::path(home) / path.substr(2)
                                   : std::filesystem::path(home);
        }
    }
    return path;
}

// Parse a value from TOML config file; empty when the file, section or key is absent
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

// All key/value pairs of one section (values unquoted, inline comments removed)
std::map<std::string, std::string> parse_config_section(const std::filesystem::path& config_path,
                                                        const std::string& section);

// Resolution order: override, $PARAFETCH_CONFIG, $XDG_CONFIG_HOME/parafetch/config.toml,
// ~/.config/parafetch/config.toml
std::filesystem::path get_config_path(const std::string& override_path = "");

// Typed value parsers; nullopt for malformed input
std::optional<int> parse_int(std::string_view s);
std::optional<bool> parse_bool(std::string_view s);

/// Overlay the [downloader] section of config_path onto base.
/// A missing file leaves base unchanged; malformed values are InvalidArgument.
downloader::Expected<downloader::DownloaderConfig>
loadDownloaderConfig(const std::filesystem::path& config_path,
                     downloader::DownloaderConfig base = {});

} // namespace parafetch::config
