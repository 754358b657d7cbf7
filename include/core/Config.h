#ifndef DECOPY_CONFIG_H
#define DECOPY_CONFIG_H

#include <cstddef>
#include <filesystem>

namespace decopy {

/**
 * @brief Configuration struct for decopy
 *
 * Loaded once in main(), CLI flags applied on top, then passed as const&.
 */
struct Config {
    // Prompt
    bool assume_yes = false;            // Skip the [Y]/[N] confirmation

    // Output
    bool verbose = false;
    bool color = true;
    std::size_t preview_entries = 5;    // Source entries listed before the prompt

    // Copy engine
    std::size_t chunk_size = 64 * 1024;     // Bytes per read/write, one progress tick each
    std::size_t channel_capacity = 16;      // Pending events before progress is overwritten
};

/**
 * @brief Get the default config file path
 * @return $XDG_CONFIG_HOME/decopy/config.json, or ~/.config/decopy/config.json
 * @throws ConfigException if neither XDG_CONFIG_HOME nor HOME is set
 */
std::filesystem::path defaultConfigPath();

/**
 * @brief Load configuration from file
 *
 * Loads from JSON file and merges with environment variables.
 * Environment variables take precedence over file values.
 *
 * Precedence order (highest to lowest):
 * 1. Environment variables (DECOPY_ASSUME_YES, DECOPY_VERBOSE, NO_COLOR)
 * 2. Config file values
 * 3. Default values in Config struct
 *
 * A missing file is not an error.
 *
 * @param path Path to config file
 * @return Loaded config (not validated)
 * @throws ParseException if the file is not valid JSON or has wrong types
 * @throws ConfigException if the path cannot be inspected (permissions, symlink loop)
 */
Config loadConfig(const std::filesystem::path& path);

/**
 * @brief Save configuration to file
 *
 * Writes config to JSON file with pretty formatting.
 * Creates parent directories if they don't exist.
 *
 * @param cfg Config to save
 * @param path Path to config file
 * @throws ConfigException if file cannot be written
 */
void saveConfig(const Config& cfg, const std::filesystem::path& path);

/**
 * @brief Validate configuration ranges
 * @param cfg Config to validate
 * @throws ConfigException if validation fails
 */
void validateConfig(const Config& cfg);

} // namespace decopy

#endif // DECOPY_CONFIG_H
