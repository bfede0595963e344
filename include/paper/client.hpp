#ifndef PAPER_CLIENT_HPP
#define PAPER_CLIENT_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "paper/errors.hpp"
#include "paper/net/connection.hpp"
#include "paper/net/endpoint.hpp"
#include "paper/net/policy.hpp"
#include "paper/net/types.hpp"
#include "paper/util/types.hpp"

namespace paper {

using net::CacheSize;
using net::ConnectionState;
using net::Policy;
using net::PolicyInfo;
using net::Status;

struct ClientOptions {
    util::Duration timeout{0};          // per request, 0 = wait forever
    util::Duration connect_timeout{0};  // connect + handshake, 0 = wait forever

    // how many times a call may reconnect and retry after a transport fault.
    // 0 = a faulted client stays faulted until reconnect() is called
    int reconnect_attempts = 0;
};

/*
    client for one paper cache server ("paper://host:port").

    the constructor only parses the address; the socket is opened by connect() or lazily by the
    first call. every call is one request and one reply on the same stream. errors:
        - the server said no (missing key aside) -> ProtocolError, client stays usable
        - transport, framing or timeout problem -> ConnectionError / CodecError / TimeoutError,
          client is Faulted until reconnect()

    note: a Client is not thread safe. one request is in flight at a time and replies are matched
    to requests by order alone, so two threads sharing a client would read each other's replies.
    use one client per thread.

    a moved-from client may only be destroyed or assigned to. its state(), connected(),
    last_error(), endpoint() and disconnect() are safe and report Disconnected; any other call
    is undefined.
*/
class Client {
   public:
    // throws AddressError
    explicit Client(std::string_view address, const ClientOptions& options = {});
    ~Client();

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;
    Client(Client&&) noexcept;
    Client& operator=(Client&&) noexcept;

    void connect();
    void reconnect();
    void disconnect() noexcept;

    [[nodiscard]] bool connected() const noexcept;
    [[nodiscard]] ConnectionState state() const noexcept;
    [[nodiscard]] const std::string& last_error() const noexcept;
    [[nodiscard]] const net::Endpoint& endpoint() const noexcept;

    // server replies "pong"
    std::string ping();
    std::string version();

    // nullopt when the key is not cached. peek() does not count as an access for eviction
    [[nodiscard]] std::optional<std::string> get(std::string_view key);
    [[nodiscard]] std::optional<std::string> peek(std::string_view key);

    // ttl of nullopt or 0 stores without expiry
    void set(std::string_view key, std::string_view value,
             std::optional<util::Seconds> ttl = std::nullopt);

    // false when there was nothing to delete
    bool del(std::string_view key);
    [[nodiscard]] bool has(std::string_view key);

    // remaining lifetime. nullopt when the key is missing or never expires
    [[nodiscard]] std::optional<util::Seconds> ttl(std::string_view key);

    // nullopt clears the expiry. throws ProtocolError if the key is missing
    void set_ttl(std::string_view key, std::optional<util::Seconds> ttl);

    // stored size of one value in bytes, nullopt when the key is missing
    [[nodiscard]] std::optional<uint32_t> value_size(std::string_view key);

    [[nodiscard]] CacheSize size();
    [[nodiscard]] Status status();

    [[nodiscard]] PolicyInfo policy_get();
    void policy_set(const Policy& policy);

    // new capacity in bytes
    void resize(int64_t max_size);

    // both drop every entry; the server has a single wipe command
    void clear();
    void wipe();

   private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace paper

#endif
