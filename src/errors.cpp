#include "paper/errors.hpp"

#include <utility>

namespace paper {

std::string_view describe(ErrorOrigin origin, uint8_t code) noexcept {
    if (origin == ErrorOrigin::Server) {
        switch (static_cast<ServerErrorCode>(code)) {
            case ServerErrorCode::MaxConnectionsExceeded:
                return "the maximum number of connections was exceeded";
            case ServerErrorCode::Unauthorized:
                return "unauthorized";
            default:
                return "an internal server error occurred";
        }
    }

    switch (static_cast<CacheErrorCode>(code)) {
        case CacheErrorCode::KeyNotFound:
            return "the key was not found in the cache";
        case CacheErrorCode::ZeroValueSize:
            return "the value size cannot be zero";
        case CacheErrorCode::ExceedingValueSize:
            return "the value size cannot exceed the cache size";
        case CacheErrorCode::ZeroCacheSize:
            return "the cache size cannot be zero";
        case CacheErrorCode::UnconfiguredPolicy:
            return "unconfigured policy";
        case CacheErrorCode::InvalidPolicy:
            return "invalid policy";
        default:
            return "an internal cache error occurred";
    }
}

// unknown codes are kept as-is so callers can still see what the server sent
ErrorReply ErrorReply::cache(uint8_t code) {
    return {ErrorOrigin::Cache, code, std::string(describe(ErrorOrigin::Cache, code))};
}

ErrorReply ErrorReply::server(uint8_t code) {
    return {ErrorOrigin::Server, code, std::string(describe(ErrorOrigin::Server, code))};
}

ProtocolError::ProtocolError(std::string_view operation, ErrorReply reply)
    : Error(std::string(operation) + " failed: " + reply.message), reply_(std::move(reply)) {}

}  // namespace paper
