#include "paper/net/policy.hpp"

#include <charconv>
#include <system_error>

namespace paper::net {

namespace {

// shortest plain decimal that reads back to the same double: 0.25 -> "0.25", 1.0 -> "1",
// 0.00001 -> "0.00001". never exponent form, the server splits policy strings on '-'
std::string format_double(double value) {
    char buf[512];
    auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), value, std::chars_format::fixed);
    if (ec != std::errc()) {
        return "0";
    }
    return std::string(buf, end);
}

std::optional<double> parse_double(std::string_view text) {
    if (text.empty()) {
        return std::nullopt;
    }
    double value = 0.0;
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || end != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

}  // namespace

bool operator==(const Policy& a, const Policy& b) noexcept {
    if (a.kind != b.kind) {
        return false;
    }
    switch (a.kind) {
        case Policy::Kind::TwoQ:
            return a.k_in == b.k_in && a.k_out == b.k_out;
        case Policy::Kind::SThreeFifo:
            return a.ratio == b.ratio;
        default:
            return true;
    }
}

std::string to_string(const Policy& policy) {
    switch (policy.kind) {
        case Policy::Kind::Auto:
            return "auto";
        case Policy::Kind::Lfu:
            return "lfu";
        case Policy::Kind::Fifo:
            return "fifo";
        case Policy::Kind::Clock:
            return "clock";
        case Policy::Kind::Sieve:
            return "sieve";
        case Policy::Kind::Lru:
            return "lru";
        case Policy::Kind::Mru:
            return "mru";
        case Policy::Kind::TwoQ:
            return "2q-" + format_double(policy.k_in) + "-" + format_double(policy.k_out);
        case Policy::Kind::Arc:
            return "arc";
        case Policy::Kind::SThreeFifo:
            return "s3-fifo-" + format_double(policy.ratio);
    }
    return "?";
}

std::optional<Policy> parse_policy(std::string_view text) {
    Policy policy;

    if (text == "auto") {
        policy.kind = Policy::Kind::Auto;
    } else if (text == "lfu") {
        policy.kind = Policy::Kind::Lfu;
    } else if (text == "fifo") {
        policy.kind = Policy::Kind::Fifo;
    } else if (text == "clock") {
        policy.kind = Policy::Kind::Clock;
    } else if (text == "sieve") {
        policy.kind = Policy::Kind::Sieve;
    } else if (text == "lru") {
        policy.kind = Policy::Kind::Lru;
    } else if (text == "mru") {
        policy.kind = Policy::Kind::Mru;
    } else if (text == "arc") {
        policy.kind = Policy::Kind::Arc;
    } else if (text.substr(0, 3) == "2q-") {
        // "2q-<k_in>-<k_out>"
        std::string_view params = text.substr(3);
        size_t dash = params.find('-');
        if (dash == std::string_view::npos) {
            return std::nullopt;
        }
        auto k_in = parse_double(params.substr(0, dash));
        auto k_out = parse_double(params.substr(dash + 1));
        if (!k_in || !k_out) {
            return std::nullopt;
        }
        return Policy::two_q(*k_in, *k_out);
    } else if (text.substr(0, 8) == "s3-fifo-") {
        auto ratio = parse_double(text.substr(8));
        if (!ratio) {
            return std::nullopt;
        }
        return Policy::s3_fifo(*ratio);
    } else {
        return std::nullopt;
    }

    return policy;
}

}  // namespace paper::net
