#include "peer_config.h"
#include "fs.h"
#include "logger.h"
#include <sstream>

#define LOG_CONFIG_DEBUG(message) LOG_DEBUG("config", message)
#define LOG_CONFIG_INFO(message)  LOG_INFO("config", message)

namespace blockshare {

namespace {

/** Largest accepted block size; a block travels in one frame */
constexpr uint32_t MAX_BLOCK_SIZE = 64 * 1024 * 1024;

long long parse_integer(const std::string& option, const std::string& text) {
    size_t consumed = 0;
    long long value = 0;
    try {
        value = std::stoll(text, &consumed);
    } catch (const std::exception&) {
        throw ConfigError("option " + option + " expects an integer, got '" + text + "'");
    }
    if (consumed != text.size()) {
        throw ConfigError("option " + option + " expects an integer, got '" + text + "'");
    }
    return value;
}

int parse_int(const std::string& option, const std::string& text) {
    long long value = parse_integer(option, text);
    if (value < INT32_MIN || value > INT32_MAX) {
        throw ConfigError("option " + option + " out of range: " + text);
    }
    return static_cast<int>(value);
}

uint32_t parse_block_size(const std::string& option, long long value) {
    if (value <= 0 || value > MAX_BLOCK_SIZE) {
        throw ConfigError(option + " must be between 1 and " + std::to_string(MAX_BLOCK_SIZE) +
                          ", got " + std::to_string(value));
    }
    return static_cast<uint32_t>(value);
}

std::vector<PeerAddress> parse_peers(const std::string& option, const std::string& text) {
    std::vector<PeerAddress> peers;
    std::string bad_entry;
    if (!network_utils::parse_address_list(text, peers, bad_entry)) {
        throw ConfigError(option + ": invalid neighbor address '" + bad_entry + "' (expected host:port)");
    }
    return peers;
}

int json_int(const nlohmann::json& value, const std::string& key) {
    if (!value.is_number_integer()) {
        throw ConfigError("config key '" + key + "' must be an integer");
    }
    long long v = value.get<long long>();
    if (v < INT32_MIN || v > INT32_MAX) {
        throw ConfigError("config key '" + key + "' out of range");
    }
    return static_cast<int>(v);
}

std::string json_string(const nlohmann::json& value, const std::string& key) {
    if (!value.is_string()) {
        throw ConfigError("config key '" + key + "' must be a string");
    }
    return value.get<std::string>();
}

bool json_bool(const nlohmann::json& value, const std::string& key) {
    if (!value.is_boolean()) {
        throw ConfigError("config key '" + key + "' must be a boolean");
    }
    return value.get<bool>();
}

void require_positive(const char* name, int value) {
    if (value <= 0) {
        throw ConfigError(std::string(name) + " must be positive, got " + std::to_string(value));
    }
}

} // anonymous namespace

void PeerConfig::validate() const {
    if (port < 0) {
        throw ConfigError("--port is required");
    }
    if (port > 65535) {
        throw ConfigError("port must be between 0 and 65535, got " + std::to_string(port));
    }
    if (block_size == 0 || block_size > MAX_BLOCK_SIZE) {
        throw ConfigError("block size must be between 1 and " + std::to_string(MAX_BLOCK_SIZE));
    }

    LogLevel level;
    if (!parse_log_level(log_level, level)) {
        throw ConfigError("unknown log level '" + log_level + "' (expected debug, info, warn or error)");
    }

    if (seed) {
        if (file.empty()) {
            throw ConfigError("--seed requires --file");
        }
    } else {
        if (peers.empty()) {
            throw ConfigError("a leecher needs at least one neighbor in --peers");
        }
        if (outfile.empty()) {
            throw ConfigError("--outfile must not be empty");
        }
    }

    require_positive("connect_timeout_ms", connect_timeout_ms);
    require_positive("request_timeout_ms", request_timeout_ms);
    require_positive("retry_backoff_ms", retry_backoff_ms);
    require_positive("max_consecutive_failures", max_consecutive_failures);
    require_positive("max_consecutive_refusals", max_consecutive_refusals);
    require_positive("progress_interval_ms", progress_interval_ms);
    require_positive("metadata_wait_timeout_ms", metadata_wait_timeout_ms);
    require_positive("session_idle_timeout_ms", session_idle_timeout_ms);
    require_positive("accept_poll_ms", accept_poll_ms);
    require_positive("metadata_attempts", metadata_attempts);
}

nlohmann::json PeerConfig::to_json() const {
    nlohmann::json json;
    json["host"] = host;
    json["port"] = port;
    nlohmann::json peer_list = nlohmann::json::array();
    for (const auto& peer : peers) {
        peer_list.push_back(peer.to_string());
    }
    json["peers"] = peer_list;
    json["block_size"] = block_size;
    json["file"] = file;
    json["outfile"] = outfile;
    json["seed"] = seed;
    json["exit_when_done"] = exit_when_done;
    json["log_level"] = log_level;
    json["connect_timeout_ms"] = connect_timeout_ms;
    json["request_timeout_ms"] = request_timeout_ms;
    json["retry_backoff_ms"] = retry_backoff_ms;
    json["max_consecutive_failures"] = max_consecutive_failures;
    json["max_consecutive_refusals"] = max_consecutive_refusals;
    json["progress_interval_ms"] = progress_interval_ms;
    json["metadata_wait_timeout_ms"] = metadata_wait_timeout_ms;
    json["session_idle_timeout_ms"] = session_idle_timeout_ms;
    json["accept_poll_ms"] = accept_poll_ms;
    json["metadata_attempts"] = metadata_attempts;
    return json;
}

void apply_config_json(const nlohmann::json& json, PeerConfig& config) {
    if (!json.is_object()) {
        throw ConfigError("config must be a JSON object");
    }

    for (auto it = json.begin(); it != json.end(); ++it) {
        const std::string& key = it.key();
        const nlohmann::json& value = it.value();

        if (key == "host") {
            config.host = json_string(value, key);
        } else if (key == "port") {
            config.port = json_int(value, key);
        } else if (key == "peers") {
            if (value.is_string()) {
                config.peers = parse_peers(key, value.get<std::string>());
            } else if (value.is_array()) {
                std::vector<PeerAddress> peers;
                for (const auto& entry : value) {
                    PeerAddress address;
                    if (!entry.is_string() || !network_utils::parse_address(entry.get<std::string>(), address)) {
                        throw ConfigError("config key 'peers' has an invalid entry: " + entry.dump());
                    }
                    peers.push_back(address);
                }
                config.peers = peers;
            } else {
                throw ConfigError("config key 'peers' must be an array or a comma-separated string");
            }
        } else if (key == "block_size") {
            config.block_size = parse_block_size(key, json_int(value, key));
        } else if (key == "file") {
            config.file = json_string(value, key);
        } else if (key == "outfile") {
            config.outfile = json_string(value, key);
        } else if (key == "seed") {
            config.seed = json_bool(value, key);
        } else if (key == "exit_when_done") {
            config.exit_when_done = json_bool(value, key);
        } else if (key == "log_level") {
            config.log_level = json_string(value, key);
        } else if (key == "connect_timeout_ms") {
            config.connect_timeout_ms = json_int(value, key);
        } else if (key == "request_timeout_ms") {
            config.request_timeout_ms = json_int(value, key);
        } else if (key == "retry_backoff_ms") {
            config.retry_backoff_ms = json_int(value, key);
        } else if (key == "max_consecutive_failures") {
            config.max_consecutive_failures = json_int(value, key);
        } else if (key == "max_consecutive_refusals") {
            config.max_consecutive_refusals = json_int(value, key);
        } else if (key == "progress_interval_ms") {
            config.progress_interval_ms = json_int(value, key);
        } else if (key == "metadata_wait_timeout_ms") {
            config.metadata_wait_timeout_ms = json_int(value, key);
        } else if (key == "session_idle_timeout_ms") {
            config.session_idle_timeout_ms = json_int(value, key);
        } else if (key == "accept_poll_ms") {
            config.accept_poll_ms = json_int(value, key);
        } else if (key == "metadata_attempts") {
            config.metadata_attempts = json_int(value, key);
        } else {
            throw ConfigError("unknown config key '" + key + "'");
        }
    }
}

void load_config_file(const std::string& path, PeerConfig& config) {
    LOG_CONFIG_INFO("Loading configuration from " << path);

    std::string text;
    if (!read_file_text(path, text)) {
        throw ConfigError("cannot read config file " + path);
    }

    nlohmann::json json;
    try {
        json = nlohmann::json::parse(text);
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError("failed to parse config file " + path + ": " + e.what());
    }

    apply_config_json(json, config);
}

bool parse_command_line(const std::vector<std::string>& args, PeerConfig& config) {
    // Split "--opt=value" and "--opt value" into (name, value) pairs
    struct Option {
        std::string name;
        std::string value;
        bool has_value;
    };

    static const char* const flags[] = {"--seed", "--exit-when-done", "--help", "-h"};
    auto is_flag = [](const std::string& name) {
        for (const char* flag : flags) {
            if (name == flag) return true;
        }
        return false;
    };

    std::vector<Option> options;
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg.compare(0, 1, "-") != 0) {
            throw ConfigError("unexpected argument '" + arg + "'");
        }

        Option option;
        size_t eq = arg.find('=');
        if (eq != std::string::npos) {
            option.name = arg.substr(0, eq);
            option.value = arg.substr(eq + 1);
            option.has_value = true;
            if (is_flag(option.name)) {
                throw ConfigError("option " + option.name + " takes no value");
            }
        } else {
            option.name = arg;
            option.has_value = false;
            if (!is_flag(arg)) {
                if (i + 1 >= args.size()) {
                    throw ConfigError("option " + arg + " requires a value");
                }
                option.value = args[++i];
                option.has_value = true;
            }
        }
        options.push_back(option);
    }

    for (const auto& option : options) {
        if (option.name == "--help" || option.name == "-h") {
            return false;
        }
    }

    // The config file goes first so that explicit flags override it
    for (const auto& option : options) {
        if (option.name == "--config") {
            load_config_file(option.value, config);
        }
    }

    for (const auto& option : options) {
        const std::string& name = option.name;
        const std::string& value = option.value;

        if (name == "--config") {
            continue;
        } else if (name == "--host") {
            config.host = value;
        } else if (name == "--port") {
            config.port = parse_int(name, value);
        } else if (name == "--peers") {
            config.peers = parse_peers(name, value);
        } else if (name == "--blocksize" || name == "--block-size") {
            config.block_size = parse_block_size(name, parse_integer(name, value));
        } else if (name == "--file") {
            config.file = value;
        } else if (name == "--outfile") {
            config.outfile = value;
        } else if (name == "--seed") {
            config.seed = true;
        } else if (name == "--exit-when-done") {
            config.exit_when_done = true;
        } else if (name == "--log-level") {
            config.log_level = value;
        } else {
            throw ConfigError("unknown option '" + name + "'");
        }
    }

    LOG_CONFIG_DEBUG("Effective configuration: " << config.to_json().dump());
    return true;
}

std::string usage_text(const std::string& program_name) {
    std::ostringstream oss;
    oss << "Usage: " << program_name << " --port <port> [options]\n";
    oss << "\nOptions:\n";
    oss << "  --host <addr>          Listening address (default 127.0.0.1)\n";
    oss << "  --port <port>          Listening port (required)\n";
    oss << "  --peers <list>         Comma-separated host:port neighbors\n";
    oss << "  --blocksize <bytes>    Block size, authoritative on the seeder (default 1024)\n";
    oss << "  --file <path>          File to share (seeder)\n";
    oss << "  --outfile <path>       Where to write the download (default downloaded.bin)\n";
    oss << "  --seed                 Start as seeder with the complete file\n";
    oss << "  --config <path>        JSON config file, overridden by the options above\n";
    oss << "  --log-level <level>    debug, info, warn or error (default info)\n";
    oss << "  --exit-when-done       Leecher exits after verification instead of seeding on\n";
    oss << "  --help                 Show this help\n";
    oss << "\nExamples:\n";
    oss << "  " << program_name << " --port 5000 --seed --file data.bin\n";
    oss << "  " << program_name << " --port 5001 --peers 127.0.0.1:5000 --outfile copy.bin\n";
    return oss.str();
}

} // namespace blockshare
