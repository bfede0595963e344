#ifndef PAPER_UTIL_CONFIG_HPP
#define PAPER_UTIL_CONFIG_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "paper/util/logger.hpp"

namespace paper {
struct ClientOptions;
}

namespace paper::util {

struct Config {
    // connection
    std::string address = "paper://127.0.0.1:3145";
    int64_t timeout_ms = 0;  // per request, 0 = wait forever
    int64_t connect_timeout_ms = 0;
    int reconnect_attempts = 0;

    // logging
    LogLevel log_level = LogLevel::Warn;

    // set by -c/--config, read by the caller
    std::optional<std::filesystem::path> config_path;

    // load from file ("key = value" lines, '#' comments). nullopt if the file can't be opened.
    // throws std::invalid_argument on a malformed value
    static std::optional<Config> load_file(const std::filesystem::path& path);

    // parse CLI args, returns nullopt on --help. throws std::invalid_argument on bad input
    static std::optional<Config> parse_args(int argc, char* argv[]);

    // merge: CLI overrides file overrides defaults
    static Config merge(const Config& file_config, const Config& cli_config,
                        const Config& defaults);

    [[nodiscard]] ClientOptions client_options() const;
};

}  // namespace paper::util

#endif
