#include "paper/net/wire_codec.hpp"

#include <limits>
#include <string>
#include <type_traits>

#include "paper/errors.hpp"
#include "paper/util/binary_io.hpp"

/*
    wire format (little-endian):
    - request: [1 byte command][... command specific fields]
    - response: [1 byte ok marker][payload if ok | error code(s) if not]
    - str/buf: [4 bytes length][bytes]
    - bool: 0x21 true, 0x3F false
    there is no outer length prefix: a frame ends where its last field ends, so decoding
    needs to know which fields to expect.
*/

namespace paper::net {

namespace {

template <typename T>
constexpr bool has_key_v =
    std::is_same_v<T, cmd::Get> || std::is_same_v<T, cmd::Del> || std::is_same_v<T, cmd::Has> ||
    std::is_same_v<T, cmd::Peek> || std::is_same_v<T, cmd::GetTtl> ||
    std::is_same_v<T, cmd::ValueSize> || std::is_same_v<T, cmd::Set> ||
    std::is_same_v<T, cmd::SetTtl>;

uint32_t ttl_to_wire(const std::optional<util::Seconds>& ttl) {
    return ttl ? static_cast<uint32_t>(ttl->count()) : 0;
}

std::optional<util::Seconds> ttl_from_wire(uint32_t ttl) {
    if (ttl == 0) {
        return std::nullopt;
    }
    return util::Seconds(ttl);
}

void write_bool(std::vector<uint8_t>& buf, bool value) {
    util::write_u8(buf, value ? WireCodec::kTrue : WireCodec::kFalse);
}

bool read_bool(util::ByteReader& reader) {
    uint8_t byte = reader.read_u8();
    if (byte == WireCodec::kTrue) {
        return true;
    }
    if (byte == WireCodec::kFalse) {
        return false;
    }
    throw CodecError("invalid bool byte " + std::to_string(byte) + " at offset " +
                     std::to_string(reader.offset() - 1));
}

Policy read_policy(util::ByteReader& reader) {
    std::string text = reader.read_string();
    auto policy = parse_policy(text);
    if (!policy) {
        throw CodecError("unknown policy '" + text + "'");
    }
    return *policy;
}

void write_status(std::vector<uint8_t>& buf, const Status& s) {
    util::write_u32_le(buf, s.pid);

    util::write_u64_le(buf, s.max_size);
    util::write_u64_le(buf, s.used_size);
    util::write_u64_le(buf, s.num_objects);

    util::write_u64_le(buf, s.rss);
    util::write_u64_le(buf, s.hwm);

    util::write_u64_le(buf, s.total_gets);
    util::write_u64_le(buf, s.total_sets);
    util::write_u64_le(buf, s.total_dels);

    util::write_f64_le(buf, s.miss_ratio);

    util::write_u32_le(buf, static_cast<uint32_t>(s.policies.size()));
    for (const auto& policy : s.policies) {
        util::write_string(buf, to_string(policy));
    }
    util::write_string(buf, to_string(s.policy));
    write_bool(buf, s.is_auto_policy);

    util::write_u64_le(buf, s.uptime);
}

Status read_status(util::ByteReader& reader) {
    Status s;
    s.pid = reader.read_u32();

    s.max_size = reader.read_u64();
    s.used_size = reader.read_u64();
    s.num_objects = reader.read_u64();

    s.rss = reader.read_u64();
    s.hwm = reader.read_u64();

    s.total_gets = reader.read_u64();
    s.total_sets = reader.read_u64();
    s.total_dels = reader.read_u64();

    s.miss_ratio = reader.read_f64();

    // no reserve(): the count comes off the wire and may be garbage
    uint32_t num_policies = reader.read_u32();
    for (uint32_t i = 0; i < num_policies; ++i) {
        s.policies.push_back(read_policy(reader));
    }
    s.policy = read_policy(reader);
    s.is_auto_policy = read_bool(reader);

    s.uptime = reader.read_u64();
    return s;
}

template <typename T>
const T& expect_payload(const Response& response, ResponseShape shape) {
    const T* value = std::get_if<T>(&response.payload);
    if (value == nullptr) {
        throw CodecError("payload does not match response shape " +
                         std::to_string(static_cast<int>(shape)));
    }
    return *value;
}

}  // namespace

std::vector<uint8_t> WireCodec::encode_request(const Command& command) {
    validate(command);

    std::vector<uint8_t> out;
    util::write_u8(out, static_cast<uint8_t>(command_byte(command)));  // 1 byte command

    std::visit(
        [&out](const auto& c) {
            using T = std::decay_t<decltype(c)>;

            if constexpr (has_key_v<T>) {
                util::write_string(out, c.key);
            }

            if constexpr (std::is_same_v<T, cmd::Set>) {
                util::write_string(out, c.value);
                util::write_u32_le(out, ttl_to_wire(c.ttl));
            } else if constexpr (std::is_same_v<T, cmd::SetTtl>) {
                util::write_u32_le(out, ttl_to_wire(c.ttl));
            } else if constexpr (std::is_same_v<T, cmd::Resize>) {
                util::write_u64_le(out, static_cast<uint64_t>(c.size));
            } else if constexpr (std::is_same_v<T, cmd::SetPolicy>) {
                util::write_string(out, to_string(c.policy));
            }
        },
        command);

    return out;
}

std::optional<Command> WireCodec::decode_request(const std::vector<uint8_t>& data,
                                                 size_t& bytes_consumed) {
    util::ByteReader reader(data.data(), data.size());

    try {
        auto byte = static_cast<CommandByte>(reader.read_u8());
        Command command;

        switch (byte) {
            case CommandByte::Ping:
                command = cmd::Ping{};
                break;
            case CommandByte::Version:
                command = cmd::Version{};
                break;
            case CommandByte::Get:
                command = cmd::Get{reader.read_string()};
                break;
            case CommandByte::Set: {
                cmd::Set set;
                set.key = reader.read_string();
                set.value = reader.read_string();
                set.ttl = ttl_from_wire(reader.read_u32());
                command = std::move(set);
                break;
            }
            case CommandByte::Del:
                command = cmd::Del{reader.read_string()};
                break;
            case CommandByte::Has:
                command = cmd::Has{reader.read_string()};
                break;
            case CommandByte::Peek:
                command = cmd::Peek{reader.read_string()};
                break;
            case CommandByte::Ttl: {
                cmd::SetTtl set_ttl;
                set_ttl.key = reader.read_string();
                set_ttl.ttl = ttl_from_wire(reader.read_u32());
                command = std::move(set_ttl);
                break;
            }
            case CommandByte::Size:
                command = cmd::ValueSize{reader.read_string()};
                break;
            case CommandByte::Wipe:
                command = cmd::Wipe{};
                break;
            case CommandByte::Resize: {
                uint64_t size = reader.read_u64();
                if (size > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                    throw CodecError("resize capacity out of range");
                }
                command = cmd::Resize{static_cast<int64_t>(size)};
                break;
            }
            case CommandByte::Policy:
                command = cmd::SetPolicy{read_policy(reader)};
                break;
            case CommandByte::Status:
                command = cmd::GetStatus{};
                break;
            case CommandByte::Expiry:
                command = cmd::GetTtl{reader.read_string()};
                break;
            default:
                throw CodecError("unknown command byte " +
                                 std::to_string(static_cast<int>(byte)));
        }

        bytes_consumed = reader.offset();
        return command;
    } catch (const util::ShortBuffer&) {
        return std::nullopt;
    }
}

std::vector<uint8_t> WireCodec::encode_response(ResponseShape shape, const Response& response) {
    std::vector<uint8_t> out;

    if (!response.ok()) {
        write_bool(out, false);
        const ErrorReply& error = *response.error;
        if (error.origin == ErrorOrigin::Cache) {
            util::write_u8(out, 0);  // 0 = cache error, real code follows
            util::write_u8(out, error.code);
        } else {
            util::write_u8(out, error.code);
        }
        return out;
    }

    write_bool(out, true);

    switch (shape) {
        case ResponseShape::Ack:
            break;
        case ResponseShape::Value:
            util::write_string(out, expect_payload<std::string>(response, shape));
            break;
        case ResponseShape::Flag:
            write_bool(out, expect_payload<bool>(response, shape));
            break;
        case ResponseShape::Size:
            util::write_u32_le(out, expect_payload<uint32_t>(response, shape));
            break;
        case ResponseShape::Expiry:
            util::write_u32_le(
                out, static_cast<uint32_t>(expect_payload<util::Seconds>(response, shape).count()));
            break;
        case ResponseShape::Status:
            write_status(out, expect_payload<Status>(response, shape));
            break;
    }

    return out;
}

std::optional<Response> WireCodec::decode_response(ResponseShape shape,
                                                   const std::vector<uint8_t>& data,
                                                   size_t& bytes_consumed) {
    util::ByteReader reader(data.data(), data.size());

    try {
        Response response;

        if (!read_bool(reader)) {
            uint8_t code = reader.read_u8();
            if (code == 0) {
                response = Response::failure(ErrorReply::cache(reader.read_u8()));
            } else {
                response = Response::failure(ErrorReply::server(code));
            }
            bytes_consumed = reader.offset();
            return response;
        }

        switch (shape) {
            case ResponseShape::Ack:
                response = Response::ack();
                break;
            case ResponseShape::Value:
                response = Response::value(reader.read_string());
                break;
            case ResponseShape::Flag:
                response = Response::flag(read_bool(reader));
                break;
            case ResponseShape::Size:
                response = Response::size(reader.read_u32());
                break;
            case ResponseShape::Expiry:
                response = Response::expiry(util::Seconds(reader.read_u32()));
                break;
            case ResponseShape::Status:
                response = Response::status(read_status(reader));
                break;
        }

        bytes_consumed = reader.offset();
        return response;
    } catch (const util::ShortBuffer&) {
        return std::nullopt;
    }
}

}  // namespace paper::net
