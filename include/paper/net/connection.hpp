#ifndef PAPER_NET_CONNECTION_HPP
#define PAPER_NET_CONNECTION_HPP

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "paper/net/command.hpp"
#include "paper/net/endpoint.hpp"
#include "paper/net/types.hpp"
#include "paper/util/types.hpp"

namespace paper::net {

enum class ConnectionState : uint8_t {
    Disconnected,
    Connected,
    Faulted,
};

[[nodiscard]] std::string_view to_string(ConnectionState state) noexcept;

struct ConnectionOptions {
    util::Duration timeout{0};          // deadline for one round trip, 0 = none
    util::Duration connect_timeout{0};  // deadline for connect + handshake, 0 = none
};

/*
    one tcp stream to one endpoint, one request in flight at a time.

        Disconnected --connect()--> Connected
        Connected --io error / bad frame / timeout--> Faulted
        Faulted | Disconnected --connect()--> Connected (or throws, left Faulted)
        any --disconnect()--> Disconnected

    a Faulted connection never heals by itself: round_trip() throws ConnectionError until
    connect() succeeds again. not thread safe.
*/
class Connection {
   public:
    explicit Connection(Endpoint endpoint, const ConnectionOptions& options = {});
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    // opens the socket and reads the server's handshake reply. no-op when already Connected.
    // throws ConnectionError / TimeoutError / CodecError, or ProtocolError when the server
    // refuses the connection (e.g. too many connections)
    void connect();

    void disconnect() noexcept;

    // writes the encoded command and reads exactly one reply.
    // throws ArgumentError before any io if the command is malformed
    [[nodiscard]] Response round_trip(const Command& command);

    [[nodiscard]] ConnectionState state() const noexcept {
        return state_;
    }
    [[nodiscard]] const std::string& last_error() const noexcept {
        return last_error_;
    }
    [[nodiscard]] const Endpoint& endpoint() const noexcept {
        return endpoint_;
    }

   private:
    int open_socket(const util::Deadline& deadline);
    void send_all(const std::vector<uint8_t>& bytes, const util::Deadline& deadline);
    Response read_response(ResponseShape shape, const util::Deadline& deadline);
    void wait_for(short events, const util::Deadline& deadline, std::string_view what);

    // closes the socket, records the reason, and leaves the connection Faulted
    void fault(const std::string& reason);

    Endpoint endpoint_;
    ConnectionOptions options_;
    int socket_fd_ = -1;
    ConnectionState state_ = ConnectionState::Disconnected;
    std::string last_error_;
    std::vector<uint8_t> buffer_;
};

}  // namespace paper::net

#endif
