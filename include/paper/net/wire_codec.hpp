#ifndef PAPER_NET_WIRE_CODEC_HPP
#define PAPER_NET_WIRE_CODEC_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "paper/net/command.hpp"
#include "paper/net/types.hpp"

namespace paper::net {

class WireCodec {
   public:
    // bool fields travel as one of these two bytes
    static constexpr uint8_t kTrue = 0x21;   // '!'
    static constexpr uint8_t kFalse = 0x3F;  // '?'

    // encode a command to request bytes. validates first (throws ArgumentError)
    static std::vector<uint8_t> encode_request(const Command& command);

    // decode one request from the front of the buffer.
    // nullopt = frame incomplete, read more. throws CodecError on an invalid frame
    static std::optional<Command> decode_request(const std::vector<uint8_t>& data,
                                                 size_t& bytes_consumed);

    // encode a reply for a command of the given shape. throws CodecError if the payload held
    // by an ok response does not match the shape
    static std::vector<uint8_t> encode_response(ResponseShape shape, const Response& response);

    /*
        decode one reply from the front of the buffer. the reply layout depends on the command
        that was sent, so the caller passes its shape.
            - nullopt: the buffer holds only a prefix of a frame, read more and call again
            - Response with error set: the server rejected the request (not an exception)
            - throws CodecError: the bytes can never become a valid frame
    */
    static std::optional<Response> decode_response(ResponseShape shape,
                                                   const std::vector<uint8_t>& data,
                                                   size_t& bytes_consumed);
};

}  // namespace paper::net

#endif
