#pragma once

#include "network_utils.h"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace blockshare {

/**
 * Invalid command line, config file or option value
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * Settings of one peer process. Defaults apply unless overridden by the
 * JSON config file, which is in turn overridden by command-line options.
 */
struct PeerConfig {
    // Role and endpoints
    std::string host = "127.0.0.1";
    int port = -1;          // required; 0 binds an ephemeral port
    std::vector<PeerAddress> peers;
    uint32_t block_size = 1024;
    std::string file;
    std::string outfile = "downloaded.bin";
    bool seed = false;
    bool exit_when_done = false;
    std::string log_level = "info";

    // Timing
    int connect_timeout_ms = 2000;
    int request_timeout_ms = 3000;
    int retry_backoff_ms = 200;
    int max_consecutive_failures = 25;
    int max_consecutive_refusals = 500;  // not_owned replies in a row before giving up
    int progress_interval_ms = 1000;
    int metadata_wait_timeout_ms = 5000;
    int session_idle_timeout_ms = 60000;
    int accept_poll_ms = 1000;
    int metadata_attempts = 1;

    /**
     * Check option ranges and role requirements
     * @throws ConfigError describing the first problem found
     */
    void validate() const;

    nlohmann::json to_json() const;
};

/**
 * Overlay the keys present in a JSON object onto config
 * @throws ConfigError on unknown keys or values of the wrong type
 */
void apply_config_json(const nlohmann::json& json, PeerConfig& config);

/**
 * Load a JSON config file onto config
 * @throws ConfigError if the file is missing, not JSON, or invalid
 */
void load_config_file(const std::string& path, PeerConfig& config);

/**
 * Parse command-line arguments (without the program name). A --config file
 * is applied first, the remaining options override it.
 * Options take their value as the next argument or after '='.
 * @param args Arguments
 * @param config Config to fill
 * @return false if --help was given (config is left partially filled)
 * @throws ConfigError on unknown options, missing or malformed values
 */
bool parse_command_line(const std::vector<std::string>& args, PeerConfig& config);

/**
 * Usage text for the command line
 */
std::string usage_text(const std::string& program_name);

} // namespace blockshare
