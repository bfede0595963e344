#include "paper/util/config.hpp"

#include <fstream>
#include <iostream>
#include <stdexcept>

#include "paper/client.hpp"
#include "paper/util/types.hpp"

namespace paper::util {

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

int64_t parse_int(const std::string& key, const std::string& value) {
    size_t pos = 0;
    int64_t result = 0;
    try {
        result = std::stoll(value, &pos);
    } catch (const std::exception&) {
        throw std::invalid_argument(key + ": expected an integer, got '" + value + "'");
    }
    if (pos != value.size() || result < 0) {
        throw std::invalid_argument(key + ": expected a non-negative integer, got '" + value +
                                    "'");
    }
    return result;
}

LogLevel parse_level(const std::string& key, const std::string& value) {
    auto level = parse_log_level(value);
    if (!level) {
        throw std::invalid_argument(key + ": unknown log level '" + value + "'");
    }
    return *level;
}

// applies one "key = value" setting. returns false for keys it does not know
bool apply(Config& config, const std::string& key, const std::string& value) {
    if (key == "address") {
        config.address = value;
    } else if (key == "timeout_ms") {
        config.timeout_ms = parse_int(key, value);
    } else if (key == "connect_timeout_ms") {
        config.connect_timeout_ms = parse_int(key, value);
    } else if (key == "reconnect_attempts") {
        config.reconnect_attempts = static_cast<int>(parse_int(key, value));
    } else if (key == "log_level") {
        config.log_level = parse_level(key, value);
    } else {
        return false;
    }
    return true;
}

}  // namespace

std::optional<Config> Config::load_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    Config config;
    std::string line;

    while (std::getline(file, line)) {
        line = trim(line);

        if (line.empty() || line[0] == '#') {
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }

        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));

        // remove quotes if present
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.size() - 2);
        }

        if (!apply(config, key, value)) {
            Logger::instance().warn("config: ignoring unknown key '" + key + "'");
        }
    }

    return config;
}

std::optional<Config> Config::parse_args(int argc, char* argv[]) {
    Config config;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            std::cout << "Usage: " << argv[0] << " [options]\n"
                      << "Options:\n"
                      << "  -c, --config FILE          Config file path\n"
                      << "  -a, --address ADDR         Server address (default: "
                         "paper://127.0.0.1:3145)\n"
                      << "  -t, --timeout MS           Per-request timeout, 0 = none (default: 0)\n"
                      << "  --connect-timeout MS       Connect timeout, 0 = none (default: 0)\n"
                      << "  --reconnect N              Reconnect-and-retry attempts after a "
                         "transport fault (default: 0)\n"
                      << "  -l, --log-level LEVEL      Log level: debug, info, warn, error, none\n"
                      << "  -h, --help                 Show this help\n";
            return std::nullopt;
        }

        bool has_value = i + 1 < argc;
        if ((arg == "-c" || arg == "--config") && has_value) {
            config.config_path = argv[++i];
        } else if ((arg == "-a" || arg == "--address") && has_value) {
            apply(config, "address", argv[++i]);
        } else if ((arg == "-t" || arg == "--timeout") && has_value) {
            apply(config, "timeout_ms", argv[++i]);
        } else if (arg == "--connect-timeout" && has_value) {
            apply(config, "connect_timeout_ms", argv[++i]);
        } else if (arg == "--reconnect" && has_value) {
            apply(config, "reconnect_attempts", argv[++i]);
        } else if ((arg == "-l" || arg == "--log-level") && has_value) {
            apply(config, "log_level", argv[++i]);
        } else {
            throw std::invalid_argument("unknown or incomplete option: " + arg);
        }
    }

    return config;
}

Config Config::merge(const Config& file_config, const Config& cli_config,
                     const Config& defaults) {
    Config result = defaults;

    // file overrides defaults
    if (file_config.address != defaults.address) result.address = file_config.address;
    if (file_config.timeout_ms != defaults.timeout_ms) result.timeout_ms = file_config.timeout_ms;
    if (file_config.connect_timeout_ms != defaults.connect_timeout_ms)
        result.connect_timeout_ms = file_config.connect_timeout_ms;
    if (file_config.reconnect_attempts != defaults.reconnect_attempts)
        result.reconnect_attempts = file_config.reconnect_attempts;
    if (file_config.log_level != defaults.log_level) result.log_level = file_config.log_level;

    // CLI overrides file
    if (cli_config.address != defaults.address) result.address = cli_config.address;
    if (cli_config.timeout_ms != defaults.timeout_ms) result.timeout_ms = cli_config.timeout_ms;
    if (cli_config.connect_timeout_ms != defaults.connect_timeout_ms)
        result.connect_timeout_ms = cli_config.connect_timeout_ms;
    if (cli_config.reconnect_attempts != defaults.reconnect_attempts)
        result.reconnect_attempts = cli_config.reconnect_attempts;
    if (cli_config.log_level != defaults.log_level) result.log_level = cli_config.log_level;

    result.config_path = cli_config.config_path;
    return result;
}

ClientOptions Config::client_options() const {
    ClientOptions options;
    options.timeout = Duration(timeout_ms);
    options.connect_timeout = Duration(connect_timeout_ms);
    options.reconnect_attempts = reconnect_attempts;
    return options;
}

}  // namespace paper::util
