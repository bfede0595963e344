#include "paper/net/command.hpp"

#include <cmath>
#include <initializer_list>
#include <limits>
#include <type_traits>

#include "paper/errors.hpp"

namespace paper::net {

namespace {

constexpr uint64_t kMaxFieldBytes = std::numeric_limits<uint32_t>::max();

void check_key(std::string_view op, const std::string& key) {
    if (key.empty()) {
        throw ArgumentError(std::string(op) + ": key must not be empty");
    }
    if (key.size() > kMaxFieldBytes) {
        throw ArgumentError(std::string(op) + ": key too long");
    }
}

void check_ttl(std::string_view op, const std::optional<util::Seconds>& ttl) {
    if (!ttl) {
        return;
    }
    if (ttl->count() < 0) {
        throw ArgumentError(std::string(op) + ": ttl must not be negative");
    }
    if (static_cast<uint64_t>(ttl->count()) > std::numeric_limits<uint32_t>::max()) {
        throw ArgumentError(std::string(op) + ": ttl too large");
    }
}

// policy parameters travel as plain decimals between '-' separators
void check_policy(const Policy& policy) {
    for (double param : {policy.k_in, policy.k_out, policy.ratio}) {
        if (!std::isfinite(param) || param < 0.0) {
            throw ArgumentError("POLICY: parameters must be finite and non-negative");
        }
    }
}

}  // namespace

CommandByte command_byte(const Command& command) noexcept {
    return std::visit([](const auto& c) { return std::decay_t<decltype(c)>::byte; }, command);
}

ResponseShape response_shape(const Command& command) noexcept {
    return std::visit([](const auto& c) { return std::decay_t<decltype(c)>::shape; }, command);
}

std::string_view command_name(const Command& command) noexcept {
    return std::visit([](const auto& c) { return std::decay_t<decltype(c)>::name; }, command);
}

void validate(const Command& command) {
    std::visit(
        [](const auto& c) {
            using T = std::decay_t<decltype(c)>;

            if constexpr (std::is_same_v<T, cmd::Get> || std::is_same_v<T, cmd::Del> ||
                          std::is_same_v<T, cmd::Has> || std::is_same_v<T, cmd::Peek> ||
                          std::is_same_v<T, cmd::GetTtl> || std::is_same_v<T, cmd::ValueSize>) {
                check_key(T::name, c.key);
            } else if constexpr (std::is_same_v<T, cmd::Set>) {
                check_key(T::name, c.key);
                if (c.value.size() > kMaxFieldBytes) {
                    throw ArgumentError("SET: value too large");
                }
                check_ttl(T::name, c.ttl);
            } else if constexpr (std::is_same_v<T, cmd::SetTtl>) {
                check_key(T::name, c.key);
                check_ttl(T::name, c.ttl);
            } else if constexpr (std::is_same_v<T, cmd::Resize>) {
                if (c.size < 0) {
                    throw ArgumentError("RESIZE: capacity must not be negative");
                }
            } else if constexpr (std::is_same_v<T, cmd::SetPolicy>) {
                check_policy(c.policy);
            }
            // Ping, Version, Wipe, GetStatus: nothing to check
        },
        command);
}

}  // namespace paper::net
