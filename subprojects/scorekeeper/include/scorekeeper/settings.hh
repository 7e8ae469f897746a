#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <scorekeeper/sync/sync_dispatcher.hh>
#include <string>

namespace scorekeeper {

constexpr const char DEFAULT_CONFIG_FILE[] = "scorekeeper.conf";

struct Settings {
    std::string data_dir = ".";
    // Set iff sync_url, event_code and apikey are all configured
    std::optional<sync::Credentials> sync_credentials;
    std::chrono::milliseconds sync_timeout{5000};
    size_t sync_queue_limit = 0; // 0 means unbounded
    std::string log_file; // empty means stderr
    std::string error_log_file; // empty means stderr
};

/**
 * @brief Parses the scorekeeper configuration
 * @details Unset variables keep their defaults. The sync credentials have to
 *   be configured all together or not at all.
 *
 * @errors Throws ConfigFile::ParseError on syntax errors and
 *   std::runtime_error on invalid values
 */
Settings load_settings_from_string(std::string config);

// Like load_settings_from_string() but reads the file @p path
Settings load_settings_from_file(const std::string& path);

} // namespace scorekeeper
