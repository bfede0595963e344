#ifndef PAPER_NET_TYPES_HPP
#define PAPER_NET_TYPES_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "paper/errors.hpp"
#include "paper/net/policy.hpp"
#include "paper/util/types.hpp"

namespace paper::net {

// what a successful reply carries after the ok marker. fixed per command
enum class ResponseShape : uint8_t {
    Ack,     // nothing
    Value,   // buf
    Flag,    // bool
    Size,    // u32
    Expiry,  // u32 seconds, 0 = no expiry
    Status,  // full status record
};

struct Status {
    uint32_t pid = 0;

    uint64_t max_size = 0;
    uint64_t used_size = 0;
    uint64_t num_objects = 0;

    uint64_t rss = 0;
    uint64_t hwm = 0;

    uint64_t total_gets = 0;
    uint64_t total_sets = 0;
    uint64_t total_dels = 0;

    double miss_ratio = 0.0;

    std::vector<Policy> policies;
    Policy policy;
    bool is_auto_policy = false;

    uint64_t uptime = 0;
};

// subset of Status answered by Client::size()
struct CacheSize {
    uint64_t max_size = 0;
    uint64_t used_size = 0;
    uint64_t num_objects = 0;
};

// subset of Status answered by Client::policy_get()
struct PolicyInfo {
    Policy policy;
    std::vector<Policy> policies;
    bool is_auto = false;
};

// one alternative per ResponseShape, in the same order
using Payload = std::variant<std::monostate, std::string, bool, uint32_t, util::Seconds, Status>;

// decoded outcome of one request: a payload, or the server's error reply
struct Response {
    Payload payload;
    std::optional<ErrorReply> error;

    [[nodiscard]] bool ok() const noexcept {
        return !error.has_value();
    }

    static Response ack() {
        return {std::monostate{}, std::nullopt};
    }

    static Response value(std::string data) {
        return {std::move(data), std::nullopt};
    }

    static Response flag(bool b) {
        return {b, std::nullopt};
    }

    static Response size(uint32_t n) {
        return {n, std::nullopt};
    }

    static Response expiry(util::Seconds ttl) {
        return {ttl, std::nullopt};
    }

    static Response status(Status s) {
        return {std::move(s), std::nullopt};
    }

    static Response failure(ErrorReply reply) {
        return {std::monostate{}, std::move(reply)};
    }
};

}  // namespace paper::net

#endif
