#ifndef PAPER_NET_POLICY_HPP
#define PAPER_NET_POLICY_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace paper::net {

// eviction policy of the remote cache. on the wire it travels as its string form:
// "lfu", "2q-0.25-0.5", "s3-fifo-0.1", ...
struct Policy {
    enum class Kind : uint8_t {
        Auto,
        Lfu,
        Fifo,
        Clock,
        Sieve,
        Lru,
        Mru,
        TwoQ,
        Arc,
        SThreeFifo,
    };

    Kind kind = Kind::Lfu;

    // TwoQ only
    double k_in = 0.0;
    double k_out = 0.0;

    // SThreeFifo only
    double ratio = 0.0;

    static Policy two_q(double k_in, double k_out) {
        Policy p;
        p.kind = Kind::TwoQ;
        p.k_in = k_in;
        p.k_out = k_out;
        return p;
    }

    static Policy s3_fifo(double ratio) {
        Policy p;
        p.kind = Kind::SThreeFifo;
        p.ratio = ratio;
        return p;
    }

    friend bool operator==(const Policy& a, const Policy& b) noexcept;
    friend bool operator!=(const Policy& a, const Policy& b) noexcept {
        return !(a == b);
    }
};

[[nodiscard]] std::string to_string(const Policy& policy);

// returns nullopt if the string names no known policy
[[nodiscard]] std::optional<Policy> parse_policy(std::string_view text);

}  // namespace paper::net

#endif
