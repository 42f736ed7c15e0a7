#include <charconv>
#include <chrono>
#include <fstream>
#include <map>
#include <system_error>
#include <parafetch/config/config_helpers.h>

namespace parafetch::config {

namespace {

// Drops a trailing "# comment" that is not inside a quoted string
void strip_inline_comment(std::string& v) {
    char quote = 0;
    for (std::size_t i = 0; i < v.size(); ++i) {
        const char c = v[i];
        if (quote) {
            if (c == quote)
                quote = 0;
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '#') {
            v.erase(i);
            trim(v);
            return;
        }
    }
}

template <typename Fn> void for_each_entry(const std::filesystem::path& config_path, Fn&& fn) {
    std::ifstream file(config_path);
    if (!file) {
        return;
    }

    std::string line;
    std::string currentSection;

    while (std::getline(file, line)) {
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        // Check for section headers [section]
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end != std::string::npos) {
                currentSection = line.substr(1, end - 1);
                trim(currentSection);
            }
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos)
            continue;

        std::string k = line.substr(0, eq);
        std::string v = line.substr(eq + 1);
        trim(k);
        trim(v);
        strip_inline_comment(v);

        // Support both "downloader.workers" and "[downloader] workers"
        std::string section = currentSection;
        if (auto dot = k.find('.'); dot != std::string::npos && currentSection.empty()) {
            section = k.substr(0, dot);
            k = k.substr(dot + 1);
        }
        fn(section, k, unquote(v));
    }
}

} // namespace

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    std::string out;
    bool found = false;
    for_each_entry(config_path,
                   [&](const std::string& sec, const std::string& k, const std::string& v) {
                       if (!found && (section.empty() || sec == section) && k == key) {
                           out = v;
                           found = true;
                       }
                   });
    return out;
}

std::map<std::string, std::string> parse_config_section(const std::filesystem::path& config_path,
                                                        const std::string& section) {
    std::map<std::string, std::string> out;
    for_each_entry(config_path,
                   [&](const std::string& sec, const std::string& k, const std::string& v) {
                       if (sec == section)
                           out.emplace(k, v);
                   });
    return out;
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }

    if (const char* envPath = std::getenv("PARAFETCH_CONFIG"); envPath && *envPath) {
        return expand_tilde(envPath);
    }

    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    const char* homeEnv = std::getenv("HOME");

    std::filesystem::path configHome;
    if (xdgConfigHome && *xdgConfigHome) {
        configHome = std::filesystem::path(xdgConfigHome);
    } else if (homeEnv) {
        configHome = std::filesystem::path(homeEnv) / ".config";
    } else {
        return std::filesystem::path("~/.config") / "parafetch" / "config.toml";
    }

    return configHome / "parafetch" / "config.toml";
}

std::optional<int> parse_int(std::string_view s) {
    int v = 0;
    auto res = std::from_chars(s.data(), s.data() + s.size(), v);
    if (res.ec != std::errc() || res.ptr != s.data() + s.size())
        return std::nullopt;
    return v;
}

std::optional<bool> parse_bool(std::string_view s) {
    if (s == "true" || s == "1" || s == "yes" || s == "on")
        return true;
    if (s == "false" || s == "0" || s == "no" || s == "off")
        return false;
    return std::nullopt;
}

downloader::Expected<downloader::DownloaderConfig>
loadDownloaderConfig(const std::filesystem::path& config_path, downloader::DownloaderConfig base) {
    using downloader::Error;
    using downloader::ErrorCode;

    std::error_code ec;
    if (config_path.empty() || !std::filesystem::exists(config_path, ec)) {
        return base;
    }

    const auto values = parse_config_section(config_path, "downloader");

    auto readInt = [&](const char* key, int minValue, int& target) -> bool {
        auto it = values.find(key);
        if (it == values.end())
            return true;
        auto v = parse_int(it->second);
        if (!v || *v < minValue)
            return false;
        target = *v;
        return true;
    };
    auto readBool = [&](const char* key, bool& target) -> bool {
        auto it = values.find(key);
        if (it == values.end())
            return true;
        auto v = parse_bool(it->second);
        if (!v)
            return false;
        target = *v;
        return true;
    };
    auto invalid = [&](const char* key) {
        return Error{ErrorCode::InvalidArgument, "Invalid value for downloader." +
                                                     std::string(key) + " in " +
                                                     config_path.string() + ": '" +
                                                     values.at(key) + "'"};
    };

    if (!readInt("workers", 1, base.defaultWorkers))
        return invalid("workers");
    if (!readInt("chunk_size_mb", 0, base.defaultChunkSizeMb))
        return invalid("chunk_size_mb");
    if (!readInt("max_retries", 1, base.retry.maxAttempts))
        return invalid("max_retries");
    if (!readInt("max_redirects", 0, base.maxRedirects))
        return invalid("max_redirects");

    int timeoutSec = static_cast<int>(base.defaultTimeout.count() / 1000);
    if (!readInt("timeout_s", 1, timeoutSec))
        return invalid("timeout_s");
    base.defaultTimeout = std::chrono::seconds(timeoutSec);

    if (!readBool("keep_parts", base.keepParts))
        return invalid("keep_parts");
    if (!readBool("resume", base.resume))
        return invalid("resume");

    if (auto it = values.find("user_agent"); it != values.end() && !it->second.empty()) {
        base.userAgent = it->second;
    }
    return base;
}

} // namespace parafetch::config
