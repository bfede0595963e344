#include "paper/client.hpp"

#include <utility>
#include <variant>

#include "paper/net/command.hpp"
#include "paper/util/logger.hpp"

namespace paper {

namespace {

template <typename T>
const T& payload_as(const net::Response& response, std::string_view operation) {
    if (const T* value = std::get_if<T>(&response.payload)) {
        return *value;
    }
    // the codec decodes by shape, so this only fires on a codec bug
    throw CodecError(std::string(operation) + ": reply payload does not match its command");
}

}  // namespace

class Client::Impl {
   public:
    Impl(net::Endpoint endpoint, const ClientOptions& options)
        : connection_(std::move(endpoint), net::ConnectionOptions{options.timeout,
                                                                  options.connect_timeout}),
          reconnect_attempts_(options.reconnect_attempts) {}

    net::Connection& connection() noexcept {
        return connection_;
    }

    /*
        sends one command and returns the server's reply, ok or not.

        a Disconnected client connects first (lazy connect). a Faulted one does not: the caller
        sees ConnectionError until reconnect(), unless reconnect_attempts allows this call to
        reconnect and resend. ArgumentError and error replies are never retried.
    */
    net::Response execute(const net::Command& command) {
        net::validate(command);

        int attempt = 0;
        while (true) {
            try {
                if (connection_.state() == ConnectionState::Disconnected ||
                    (attempt > 0 && connection_.state() == ConnectionState::Faulted)) {
                    connection_.connect();
                }
                return connection_.round_trip(command);
            } catch (const ProtocolError&) {
                throw;
            } catch (const Error& e) {
                if (connection_.state() != ConnectionState::Faulted ||
                    attempt >= reconnect_attempts_) {
                    throw;
                }
                ++attempt;
                PAPER_LOG_WARN(std::string(net::command_name(command)) + " failed (" + e.what() +
                               "), reconnecting, attempt " + std::to_string(attempt) + "/" +
                               std::to_string(reconnect_attempts_));
            }
        }
    }

    // execute() for calls where any error reply is a failure
    net::Response expect_ok(const net::Command& command) {
        net::Response response = execute(command);
        if (!response.ok()) {
            throw ProtocolError(net::command_name(command), std::move(*response.error));
        }
        return response;
    }

    // execute() for calls where a missing key is an answer, not a failure
    std::optional<net::Response> expect_found(const net::Command& command) {
        net::Response response = execute(command);
        if (!response.ok()) {
            if (response.error->is(CacheErrorCode::KeyNotFound)) {
                return std::nullopt;
            }
            throw ProtocolError(net::command_name(command), std::move(*response.error));
        }
        return response;
    }

   private:
    net::Connection connection_;
    int reconnect_attempts_ = 0;
};

Client::Client(std::string_view address, const ClientOptions& options)
    : impl_(std::make_unique<Impl>(net::parse_endpoint(address), options)) {}

Client::~Client() = default;
Client::Client(Client&&) noexcept = default;
Client& Client::operator=(Client&&) noexcept = default;

void Client::connect() {
    impl_->connection().connect();
}

void Client::reconnect() {
    impl_->connection().disconnect();
    impl_->connection().connect();
}

void Client::disconnect() noexcept {
    if (impl_) {
        impl_->connection().disconnect();
    }
}

// the accessors below stay safe on a moved-from client (impl_ is null), which reads as
// Disconnected with no endpoint
bool Client::connected() const noexcept {
    return impl_ && impl_->connection().state() == ConnectionState::Connected;
}

ConnectionState Client::state() const noexcept {
    return impl_ ? impl_->connection().state() : ConnectionState::Disconnected;
}

const std::string& Client::last_error() const noexcept {
    static const std::string none;
    return impl_ ? impl_->connection().last_error() : none;
}

const net::Endpoint& Client::endpoint() const noexcept {
    static const net::Endpoint none;
    return impl_ ? impl_->connection().endpoint() : none;
}

std::string Client::ping() {
    net::Response response = impl_->expect_ok(net::cmd::Ping{});
    return payload_as<std::string>(response, "PING");
}

std::string Client::version() {
    net::Response response = impl_->expect_ok(net::cmd::Version{});
    return payload_as<std::string>(response, "VERSION");
}

std::optional<std::string> Client::get(std::string_view key) {
    auto response = impl_->expect_found(net::cmd::Get{std::string(key)});
    if (!response) {
        return std::nullopt;
    }
    return payload_as<std::string>(*response, "GET");
}

std::optional<std::string> Client::peek(std::string_view key) {
    auto response = impl_->expect_found(net::cmd::Peek{std::string(key)});
    if (!response) {
        return std::nullopt;
    }
    return payload_as<std::string>(*response, "PEEK");
}

void Client::set(std::string_view key, std::string_view value,
                 std::optional<util::Seconds> ttl) {
    impl_->expect_ok(net::cmd::Set{std::string(key), std::string(value), ttl});
}

bool Client::del(std::string_view key) {
    return impl_->expect_found(net::cmd::Del{std::string(key)}).has_value();
}

bool Client::has(std::string_view key) {
    net::Response response = impl_->expect_ok(net::cmd::Has{std::string(key)});
    return payload_as<bool>(response, "HAS");
}

std::optional<util::Seconds> Client::ttl(std::string_view key) {
    auto response = impl_->expect_found(net::cmd::GetTtl{std::string(key)});
    if (!response) {
        return std::nullopt;
    }
    util::Seconds remaining = payload_as<util::Seconds>(*response, "EXPIRY");
    if (remaining.count() == 0) {
        return std::nullopt;
    }
    return remaining;
}

void Client::set_ttl(std::string_view key, std::optional<util::Seconds> ttl) {
    impl_->expect_ok(net::cmd::SetTtl{std::string(key), ttl});
}

std::optional<uint32_t> Client::value_size(std::string_view key) {
    auto response = impl_->expect_found(net::cmd::ValueSize{std::string(key)});
    if (!response) {
        return std::nullopt;
    }
    return payload_as<uint32_t>(*response, "SIZE");
}

CacheSize Client::size() {
    Status s = status();
    return CacheSize{s.max_size, s.used_size, s.num_objects};
}

Status Client::status() {
    net::Response response = impl_->expect_ok(net::cmd::GetStatus{});
    return payload_as<Status>(response, "STATUS");
}

PolicyInfo Client::policy_get() {
    Status s = status();
    return PolicyInfo{s.policy, std::move(s.policies), s.is_auto_policy};
}

void Client::policy_set(const Policy& policy) {
    impl_->expect_ok(net::cmd::SetPolicy{policy});
}

void Client::resize(int64_t max_size) {
    impl_->expect_ok(net::cmd::Resize{max_size});
}

void Client::clear() {
    wipe();
}

void Client::wipe() {
    impl_->expect_ok(net::cmd::Wipe{});
}

}  // namespace paper
