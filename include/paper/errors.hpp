#ifndef PAPER_ERRORS_HPP
#define PAPER_ERRORS_HPP

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace paper {

/*
    error taxonomy:
        AddressError    - bad "paper://host:port" string, thrown from the Client constructor
        ArgumentError   - a call's arguments were rejected before anything hit the wire
        ConnectionError - refused / reset / closed / not connected. connection is Faulted
        CodecError      - the reply bytes are not a valid frame. connection is Faulted
        TimeoutError    - configured deadline exceeded. connection is Faulted
        ProtocolError   - the server answered with an error reply. connection stays usable
*/
class Error : public std::runtime_error {
   public:
    using std::runtime_error::runtime_error;
};

class AddressError : public Error {
   public:
    using Error::Error;
};

class ArgumentError : public Error {
   public:
    using Error::Error;
};

class ConnectionError : public Error {
   public:
    using Error::Error;
};

class CodecError : public Error {
   public:
    using Error::Error;
};

class TimeoutError : public Error {
   public:
    using Error::Error;
};

// which side of the server produced the error reply
enum class ErrorOrigin : uint8_t {
    Cache = 0,
    Server = 1,
};

enum class CacheErrorCode : uint8_t {
    Internal = 0,
    KeyNotFound = 1,
    ZeroValueSize = 2,
    ExceedingValueSize = 3,
    ZeroCacheSize = 4,
    UnconfiguredPolicy = 5,
    InvalidPolicy = 6,
};

enum class ServerErrorCode : uint8_t {
    Internal = 1,
    MaxConnectionsExceeded = 2,
    Unauthorized = 3,
};

// a well-formed error reply, exactly as the server sent it
struct ErrorReply {
    ErrorOrigin origin = ErrorOrigin::Cache;
    uint8_t code = 0;
    std::string message;

    [[nodiscard]] bool is(CacheErrorCode c) const noexcept {
        return origin == ErrorOrigin::Cache && code == static_cast<uint8_t>(c);
    }

    [[nodiscard]] bool is(ServerErrorCode c) const noexcept {
        return origin == ErrorOrigin::Server && code == static_cast<uint8_t>(c);
    }

    static ErrorReply cache(uint8_t code);
    static ErrorReply cache(CacheErrorCode code) {
        return cache(static_cast<uint8_t>(code));
    }
    static ErrorReply server(uint8_t code);
    static ErrorReply server(ServerErrorCode code) {
        return server(static_cast<uint8_t>(code));
    }
};

[[nodiscard]] std::string_view describe(ErrorOrigin origin, uint8_t code) noexcept;

class ProtocolError : public Error {
   public:
    ProtocolError(std::string_view operation, ErrorReply reply);

    [[nodiscard]] const ErrorReply& reply() const noexcept {
        return reply_;
    }
    [[nodiscard]] ErrorOrigin origin() const noexcept {
        return reply_.origin;
    }
    [[nodiscard]] uint8_t code() const noexcept {
        return reply_.code;
    }

   private:
    ErrorReply reply_;
};

}  // namespace paper

#endif
