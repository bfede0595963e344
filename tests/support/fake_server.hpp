#ifndef PAPER_TESTS_SUPPORT_FAKE_SERVER_HPP
#define PAPER_TESTS_SUPPORT_FAKE_SERVER_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "paper/net/command.hpp"
#include "paper/net/policy.hpp"
#include "paper/net/types.hpp"
#include "paper/util/types.hpp"

namespace paper::test {

// misbehaviour for the reply to the next request. consumed by that request
enum class Fault {
    None,
    CloseBeforeResponse,  // close without writing anything
    CloseMidResponse,     // write the first half of the reply, then close
    Garbage,              // write a single byte that is not a valid ok marker
    Stall,                // never reply, keep the socket open
    Split,                // write the reply one byte at a time
};

struct FakeServerOptions {
    bool reject_handshake = false;  // answer the handshake with MaxConnectionsExceeded
    uint64_t max_size = 1 << 20;
    std::string version = "0.1.0-fake";
    std::vector<net::Policy> policies = {net::Policy{net::Policy::Kind::Lfu},
                                         net::Policy{net::Policy::Kind::Lru},
                                         net::Policy::two_q(0.25, 0.5)};
};

/*
    in-process paper server for tests. listens on 127.0.0.1 with an os-assigned port and serves
    one connection at a time on a background thread, speaking the real wire format through
    WireCodec. the cache is a plain map with ttls, capacity, policy and counters.
*/
class FakeServer {
   public:
    explicit FakeServer(FakeServerOptions options = {});
    ~FakeServer();

    FakeServer(const FakeServer&) = delete;
    FakeServer& operator=(const FakeServer&) = delete;

    void start();
    void stop();

    [[nodiscard]] uint16_t port() const noexcept {
        return port_;
    }

    // "paper://127.0.0.1:<port>"
    [[nodiscard]] std::string address() const;

    void inject(Fault fault);

    // request bytes read from clients, handshakes excluded (clients send none)
    [[nodiscard]] size_t bytes_received() const noexcept {
        return bytes_received_.load();
    }
    [[nodiscard]] size_t requests_received() const noexcept {
        return requests_received_.load();
    }
    [[nodiscard]] size_t connections_accepted() const noexcept {
        return connections_accepted_.load();
    }

    [[nodiscard]] std::optional<std::string> stored(const std::string& key);

   private:
    struct Entry {
        std::string value;
        std::optional<util::TimePoint> expires_at;
    };

    void accept_loop();
    void serve(int fd);
    void write_reply(int fd, const std::vector<uint8_t>& bytes, Fault fault);

    net::Response handle(const net::Command& command);
    Entry* find(const std::string& key);
    uint64_t used_size() const;

    FakeServerOptions options_;
    uint16_t port_ = 0;
    int listen_fd_ = -1;
    std::atomic<bool> running_{false};
    std::thread thread_;

    std::atomic<size_t> bytes_received_{0};
    std::atomic<size_t> requests_received_{0};
    std::atomic<size_t> connections_accepted_{0};

    std::mutex mutex_;  // guards everything below
    Fault next_fault_ = Fault::None;
    std::map<std::string, Entry> entries_;
    net::Policy policy_;
    uint64_t max_size_;
    uint64_t total_gets_ = 0;
    uint64_t total_sets_ = 0;
    uint64_t total_dels_ = 0;
    uint64_t misses_ = 0;
    util::TimePoint started_at_;
};

}  // namespace paper::test

#endif
