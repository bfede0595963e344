#ifndef PAPER_NET_COMMAND_HPP
#define PAPER_NET_COMMAND_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "paper/net/policy.hpp"
#include "paper/net/types.hpp"
#include "paper/util/types.hpp"

namespace paper::net {

/*
    first byte of every request frame. 0..13 are the paper server's commands; Expiry (14) is a
    client-side extension used only by Client::ttl(), and needs a server that understands it.
*/
enum class CommandByte : uint8_t {
    Ping = 0,
    Version = 1,
    Auth = 2,  // reserved, never sent by this client
    Get = 3,
    Set = 4,
    Del = 5,
    Has = 6,
    Peek = 7,
    Ttl = 8,
    Size = 9,
    Wipe = 10,
    Resize = 11,
    Policy = 12,
    Status = 13,
    Expiry = 14,  // extension: remaining ttl of a key
};

/*
    one struct per operation, each holding only what that operation puts on the wire.
    byte/shape/name are compile-time facts about the operation, so an argument list can never
    be paired with the wrong command byte or reply layout.
*/
namespace cmd {

struct Ping {
    static constexpr CommandByte byte = CommandByte::Ping;
    static constexpr ResponseShape shape = ResponseShape::Value;
    static constexpr std::string_view name = "PING";
};

struct Version {
    static constexpr CommandByte byte = CommandByte::Version;
    static constexpr ResponseShape shape = ResponseShape::Value;
    static constexpr std::string_view name = "VERSION";
};

struct Get {
    static constexpr CommandByte byte = CommandByte::Get;
    static constexpr ResponseShape shape = ResponseShape::Value;
    static constexpr std::string_view name = "GET";
    std::string key;
};

struct Set {
    static constexpr CommandByte byte = CommandByte::Set;
    static constexpr ResponseShape shape = ResponseShape::Ack;
    static constexpr std::string_view name = "SET";
    std::string key;
    std::string value;
    std::optional<util::Seconds> ttl;  // nullopt or 0 = never expires
};

struct Del {
    static constexpr CommandByte byte = CommandByte::Del;
    static constexpr ResponseShape shape = ResponseShape::Ack;
    static constexpr std::string_view name = "DEL";
    std::string key;
};

struct Has {
    static constexpr CommandByte byte = CommandByte::Has;
    static constexpr ResponseShape shape = ResponseShape::Flag;
    static constexpr std::string_view name = "HAS";
    std::string key;
};

struct Peek {
    static constexpr CommandByte byte = CommandByte::Peek;
    static constexpr ResponseShape shape = ResponseShape::Value;
    static constexpr std::string_view name = "PEEK";
    std::string key;
};

struct SetTtl {
    static constexpr CommandByte byte = CommandByte::Ttl;
    static constexpr ResponseShape shape = ResponseShape::Ack;
    static constexpr std::string_view name = "TTL";
    std::string key;
    std::optional<util::Seconds> ttl;
};

// extension command (byte 14), not part of the stock server protocol
struct GetTtl {
    static constexpr CommandByte byte = CommandByte::Expiry;
    static constexpr ResponseShape shape = ResponseShape::Expiry;
    static constexpr std::string_view name = "EXPIRY";
    std::string key;
};

struct ValueSize {
    static constexpr CommandByte byte = CommandByte::Size;
    static constexpr ResponseShape shape = ResponseShape::Size;
    static constexpr std::string_view name = "SIZE";
    std::string key;
};

struct Wipe {
    static constexpr CommandByte byte = CommandByte::Wipe;
    static constexpr ResponseShape shape = ResponseShape::Ack;
    static constexpr std::string_view name = "WIPE";
};

struct Resize {
    static constexpr CommandByte byte = CommandByte::Resize;
    static constexpr ResponseShape shape = ResponseShape::Ack;
    static constexpr std::string_view name = "RESIZE";
    int64_t size = 0;  // bytes
};

struct SetPolicy {
    static constexpr CommandByte byte = CommandByte::Policy;
    static constexpr ResponseShape shape = ResponseShape::Ack;
    static constexpr std::string_view name = "POLICY";
    net::Policy policy;
};

struct GetStatus {
    static constexpr CommandByte byte = CommandByte::Status;
    static constexpr ResponseShape shape = ResponseShape::Status;
    static constexpr std::string_view name = "STATUS";
};

}  // namespace cmd

using Command = std::variant<cmd::Ping, cmd::Version, cmd::Get, cmd::Set, cmd::Del, cmd::Has,
                             cmd::Peek, cmd::SetTtl, cmd::GetTtl, cmd::ValueSize, cmd::Wipe,
                             cmd::Resize, cmd::SetPolicy, cmd::GetStatus>;

[[nodiscard]] CommandByte command_byte(const Command& command) noexcept;
[[nodiscard]] ResponseShape response_shape(const Command& command) noexcept;
[[nodiscard]] std::string_view command_name(const Command& command) noexcept;

/*
    throws ArgumentError if the command cannot be sent as-is:
        - empty key, or key / value longer than a u32 length prefix allows
        - negative ttl, or ttl beyond u32 seconds
        - negative resize capacity
        - negative, NaN or infinite policy parameters
    zero-sized values and a zero capacity are left for the server to reject.
*/
void validate(const Command& command);

}  // namespace paper::net

#endif
