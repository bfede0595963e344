#include <cctype>
#include <charconv>
#include <cstdint>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "paper/client.hpp"
#include "paper/util/config.hpp"
#include "paper/util/logger.hpp"

using paper::Client;

namespace {

void print_commands() {
    std::cout << "Commands:\n"
              << "  PING                  Health check\n"
              << "  VERSION               Server version\n"
              << "  GET key               Retrieve a value\n"
              << "  PEEK key              Retrieve without touching eviction order\n"
              << "  SET key value [secs]  Store a value, optionally expiring\n"
              << "  DEL key               Delete a key\n"
              << "  HAS key               Check if key exists\n"
              << "  TTL key               Seconds until key expires\n"
              << "  EXPIRE key secs       Set expiry, 0 = never\n"
              << "  SIZE [key]            Cache size, or size of one value\n"
              << "  STATUS                Server statistics\n"
              << "  POLICY [name]         Show or change eviction policy\n"
              << "  RESIZE bytes          Change cache capacity\n"
              << "  CLEAR | WIPE          Delete all keys\n"
              << "  RECONNECT             Drop and reopen the connection\n"
              << "  QUIT                  Exit client\n";
}

bool parse_number(const std::string& text, int64_t& out) {
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    return ec == std::errc() && ptr == text.data() + text.size();
}

std::string policy_list(const std::vector<paper::Policy>& policies) {
    std::string out;
    for (const auto& policy : policies) {
        if (!out.empty()) {
            out += ", ";
        }
        out += paper::net::to_string(policy);
    }
    return out;
}

void print_status(const paper::Status& s) {
    std::cout << "pid:          " << s.pid << "\n"
              << "max_size:     " << s.max_size << "\n"
              << "used_size:    " << s.used_size << "\n"
              << "num_objects:  " << s.num_objects << "\n"
              << "rss:          " << s.rss << "\n"
              << "hwm:          " << s.hwm << "\n"
              << "total_gets:   " << s.total_gets << "\n"
              << "total_sets:   " << s.total_sets << "\n"
              << "total_dels:   " << s.total_dels << "\n"
              << "miss_ratio:   " << s.miss_ratio << "\n"
              << "policies:     " << policy_list(s.policies) << "\n"
              << "policy:       " << paper::net::to_string(s.policy)
              << (s.is_auto_policy ? " (auto)" : "") << "\n"
              << "uptime:       " << s.uptime << "s" << std::endl;
}

// runs one REPL line. returns false on QUIT
bool run_command(Client& client, const std::string& line) {
    std::istringstream iss(line);
    std::string cmd;
    iss >> cmd;

    for (char& c : cmd) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }

    std::string key;
    if (cmd == "PING") {
        std::cout << "OK " << client.ping() << std::endl;

    } else if (cmd == "VERSION") {
        std::cout << "OK " << client.version() << std::endl;

    } else if (cmd == "GET" || cmd == "PEEK") {
        if (!(iss >> key)) {
            std::cout << "ERROR usage: " << cmd << " key" << std::endl;
            return true;
        }
        auto value = (cmd == "GET") ? client.get(key) : client.peek(key);
        if (value) {
            std::cout << "OK " << *value << std::endl;
        } else {
            std::cout << "NOT_FOUND" << std::endl;
        }

    } else if (cmd == "SET") {
        std::string value;
        std::string ttl_text;
        iss >> key >> value >> ttl_text;

        int64_t ttl = 0;
        if (key.empty() || value.empty() || (!ttl_text.empty() && !parse_number(ttl_text, ttl))) {
            std::cout << "ERROR usage: SET key value [secs]" << std::endl;
            return true;
        }
        client.set(key, value, paper::util::Seconds(ttl));
        std::cout << "OK" << std::endl;

    } else if (cmd == "DEL") {
        if (!(iss >> key)) {
            std::cout << "ERROR usage: DEL key" << std::endl;
            return true;
        }
        std::cout << (client.del(key) ? "OK" : "NOT_FOUND") << std::endl;

    } else if (cmd == "HAS") {
        if (!(iss >> key)) {
            std::cout << "ERROR usage: HAS key" << std::endl;
            return true;
        }
        std::cout << "OK " << (client.has(key) ? "1" : "0") << std::endl;

    } else if (cmd == "TTL") {
        if (!(iss >> key)) {
            std::cout << "ERROR usage: TTL key" << std::endl;
            return true;
        }
        auto ttl = client.ttl(key);
        if (ttl) {
            std::cout << "OK " << ttl->count() << std::endl;
        } else {
            std::cout << "NONE" << std::endl;
        }

    } else if (cmd == "EXPIRE") {
        std::string ttl_text;
        int64_t ttl = 0;
        if (!(iss >> key >> ttl_text) || !parse_number(ttl_text, ttl)) {
            std::cout << "ERROR usage: EXPIRE key secs" << std::endl;
            return true;
        }
        client.set_ttl(key, paper::util::Seconds(ttl));
        std::cout << "OK" << std::endl;

    } else if (cmd == "SIZE") {
        if (iss >> key) {
            auto size = client.value_size(key);
            if (size) {
                std::cout << "OK " << *size << std::endl;
            } else {
                std::cout << "NOT_FOUND" << std::endl;
            }
        } else {
            auto size = client.size();
            std::cout << "OK used " << size.used_size << " / max " << size.max_size << " bytes, "
                      << size.num_objects << " objects" << std::endl;
        }

    } else if (cmd == "STATUS") {
        print_status(client.status());

    } else if (cmd == "POLICY") {
        std::string name;
        if (iss >> name) {
            auto policy = paper::net::parse_policy(name);
            if (!policy) {
                std::cout << "ERROR unknown policy: " << name << std::endl;
                return true;
            }
            client.policy_set(*policy);
            std::cout << "OK" << std::endl;
        } else {
            auto info = client.policy_get();
            std::cout << "OK " << paper::net::to_string(info.policy)
                      << (info.is_auto ? " (auto)" : "") << " [" << policy_list(info.policies)
                      << "]" << std::endl;
        }

    } else if (cmd == "RESIZE") {
        std::string size_text;
        int64_t size = 0;
        if (!(iss >> size_text) || !parse_number(size_text, size)) {
            std::cout << "ERROR usage: RESIZE bytes" << std::endl;
            return true;
        }
        client.resize(size);
        std::cout << "OK" << std::endl;

    } else if (cmd == "CLEAR" || cmd == "WIPE") {
        client.wipe();
        std::cout << "OK" << std::endl;

    } else if (cmd == "RECONNECT") {
        client.reconnect();
        std::cout << "OK" << std::endl;

    } else if (cmd == "QUIT" || cmd == "EXIT") {
        std::cout << "BYE" << std::endl;
        return false;

    } else if (cmd == "HELP") {
        print_commands();

    } else {
        std::cout << "ERROR unknown command: " << cmd << std::endl;
    }
    return true;
}

}  // namespace

int main(int argc, char* argv[]) {
    try {
        paper::util::Config defaults;
        paper::util::Config file_config = defaults;

        auto cli_result = paper::util::Config::parse_args(argc, argv);
        if (!cli_result) {
            print_commands();
            return 0;  // --help was shown
        }

        if (cli_result->config_path) {
            auto loaded = paper::util::Config::load_file(*cli_result->config_path);
            if (loaded) {
                file_config = *loaded;
            } else {
                std::cerr << "Warning: Could not load config file: " << *cli_result->config_path
                          << std::endl;
            }
        }

        // CLI > file > defaults
        auto config = paper::util::Config::merge(file_config, *cli_result, defaults);
        paper::util::Logger::instance().set_level(config.log_level);

        Client client(config.address, config.client_options());

        try {
            client.connect();
            std::cout << "Connected to " << client.endpoint().to_string() << std::endl;
        } catch (const paper::Error& e) {
            std::cerr << "Connection failed: " << e.what() << std::endl;
            return 1;
        }

        std::string line;
        std::cout << "> ";

        while (std::getline(std::cin, line)) {
            if (!line.empty()) {
                try {
                    if (!run_command(client, line)) {
                        break;
                    }
                } catch (const paper::Error& e) {
                    std::cout << "ERROR " << e.what() << std::endl;
                    if (client.state() == paper::ConnectionState::Faulted) {
                        std::cout << "connection lost, use RECONNECT" << std::endl;
                    }
                }
            }
            std::cout << "> ";
        }

        client.disconnect();
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Fatal: " << e.what() << std::endl;
        return 1;
    }
}
