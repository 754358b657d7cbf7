#include "Config.h"
#include "Exceptions.h"
#include "Utils.h"
#include <nlohmann/json.hpp>
#include <fstream>
#include <cstdlib>
#include <string>
#include <system_error>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace decopy {

namespace {

// "1", "true", "yes" and "on" count as set; anything else as unset
bool envFlag(const char* name, bool& out)
{
    const char* value = std::getenv(name);
    if (!value || *value == '\0') {
        return false;
    }
    std::string v = toLower(trim(value));
    out = (v == "1" || v == "true" || v == "yes" || v == "on");
    return true;
}

} // namespace

fs::path defaultConfigPath() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg != '\0') {
        return fs::path(xdg) / "decopy" / "config.json";
    }

    const char* home = std::getenv("HOME");
    if (!home) {
        throw ConfigException("HOME environment variable not set");
    }

    return fs::path(home) / ".config" / "decopy" / "config.json";
}

Config loadConfig(const fs::path& path) {
    Config cfg;

    std::error_code ec;
    bool present = fs::exists(path, ec);
    if (ec) {
        throw ConfigException("Cannot access config file " + path.string() + ": " +
                              ec.message());
    }

    if (present) {
        try {
            std::ifstream file(path);
            if (!file) {
                throw ConfigException("Failed to open config file: " + path.string());
            }

            json config_json = json::parse(file);

            if (config_json.contains("assume_yes")) {
                cfg.assume_yes = config_json["assume_yes"].get<bool>();
            }

            if (config_json.contains("verbose")) {
                cfg.verbose = config_json["verbose"].get<bool>();
            }

            if (config_json.contains("color")) {
                cfg.color = config_json["color"].get<bool>();
            }

            if (config_json.contains("preview_entries")) {
                cfg.preview_entries = config_json["preview_entries"].get<std::size_t>();
            }

            if (config_json.contains("chunk_size")) {
                cfg.chunk_size = config_json["chunk_size"].get<std::size_t>();
            }

            if (config_json.contains("channel_capacity")) {
                cfg.channel_capacity = config_json["channel_capacity"].get<std::size_t>();
            }

        } catch (const json::exception& e) {
            throw ParseException("Failed to parse config file: " + std::string(e.what()),
                                path.string());
        }
    }

    // Override with environment variables (highest precedence)
    bool flag = false;
    if (envFlag("DECOPY_ASSUME_YES", flag)) {
        cfg.assume_yes = flag;
    }

    if (envFlag("DECOPY_VERBOSE", flag)) {
        cfg.verbose = flag;
    }

    // https://no-color.org: any non-empty value disables colour
    const char* no_color = std::getenv("NO_COLOR");
    if (no_color && *no_color != '\0') {
        cfg.color = false;
    }

    return cfg;
}

void saveConfig(const Config& cfg, const fs::path& path) {
    try {
        if (!path.parent_path().empty()) {
            fs::create_directories(path.parent_path());
        }

        json config_json;

        config_json["assume_yes"] = cfg.assume_yes;
        config_json["verbose"] = cfg.verbose;
        config_json["color"] = cfg.color;
        config_json["preview_entries"] = cfg.preview_entries;
        config_json["chunk_size"] = cfg.chunk_size;
        config_json["channel_capacity"] = cfg.channel_capacity;

        // Write atomically (write to temp, then rename)
        fs::path temp_path = path.string() + ".tmp";

        std::ofstream file(temp_path);
        if (!file) {
            throw ConfigException("Failed to create temp config file: " + temp_path.string());
        }

        file << config_json.dump(2);
        file.close();

        if (!file) {
            throw ConfigException("Failed to write config file: " + temp_path.string());
        }

        fs::rename(temp_path, path);

    } catch (const fs::filesystem_error& e) {
        throw ConfigException("Filesystem error while saving config: " +
                              std::string(e.what()));
    }
}

void validateConfig(const Config& cfg) {
    if (cfg.chunk_size < 4 * 1024 || cfg.chunk_size > 64 * 1024 * 1024) {
        throw ConfigException("chunk_size must be between 4096 and 67108864 bytes");
    }

    if (cfg.channel_capacity < 1 || cfg.channel_capacity > 4096) {
        throw ConfigException("channel_capacity must be between 1 and 4096");
    }

    if (cfg.preview_entries > 100) {
        throw ConfigException("preview_entries must be between 0 and 100");
    }
}

} // namespace decopy
