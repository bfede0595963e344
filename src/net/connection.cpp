#include "paper/net/connection.hpp"

#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <memory>
#include <optional>
#include <utility>

#include "paper/errors.hpp"
#include "paper/net/wire_codec.hpp"
#include "paper/util/logger.hpp"

namespace paper::net {

namespace {

// errno is only valid right after the failed call, so format it immediately
std::string errno_string(std::string_view what) {
    return std::string(what) + ": " + std::strerror(errno);
}

struct AddrInfoDeleter {
    void operator()(addrinfo* info) const noexcept {
        freeaddrinfo(info);
    }
};

enum class ConnectResult {
    Connected,
    Failed,
    TimedOut,
};

/*
    without a deadline this is a plain blocking connect(). with one, the socket is switched to
    non-blocking so connect() returns EINPROGRESS, poll() waits for writability until the
    deadline, and SO_ERROR tells whether the handshake actually succeeded. the socket is put back
    into blocking mode afterwards; all later io waits are bounded by poll() instead.
*/
ConnectResult connect_socket(int fd, const addrinfo* ai, const util::Deadline& deadline,
                             std::string& reason) {
    if (!deadline) {
        while (::connect(fd, ai->ai_addr, ai->ai_addrlen) < 0) {
            if (errno != EINTR) {
                reason = errno_string("connect");
                return ConnectResult::Failed;
            }
        }
        return ConnectResult::Connected;
    }

    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        reason = errno_string("fcntl");
        return ConnectResult::Failed;
    }

    if (::connect(fd, ai->ai_addr, ai->ai_addrlen) < 0) {
        if (errno != EINPROGRESS) {
            reason = errno_string("connect");
            return ConnectResult::Failed;
        }

        pollfd pfd{fd, POLLOUT, 0};
        int rc = 0;
        do {
            rc = poll(&pfd, 1, util::remaining_ms(deadline));
        } while (rc < 0 && errno == EINTR);

        if (rc == 0) {
            reason = "connect timed out";
            return ConnectResult::TimedOut;
        }
        if (rc < 0) {
            reason = errno_string("poll");
            return ConnectResult::Failed;
        }

        int so_error = 0;
        socklen_t len = sizeof(so_error);
        if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) < 0) {
            reason = errno_string("getsockopt");
            return ConnectResult::Failed;
        }
        if (so_error != 0) {
            reason = std::string("connect: ") + std::strerror(so_error);
            return ConnectResult::Failed;
        }
    }

    if (fcntl(fd, F_SETFL, flags) < 0) {
        reason = errno_string("fcntl");
        return ConnectResult::Failed;
    }
    return ConnectResult::Connected;
}

}  // namespace

std::string_view to_string(ConnectionState state) noexcept {
    switch (state) {
        case ConnectionState::Disconnected:
            return "disconnected";
        case ConnectionState::Connected:
            return "connected";
        case ConnectionState::Faulted:
            return "faulted";
    }
    return "?";
}

Connection::Connection(Endpoint endpoint, const ConnectionOptions& options)
    : endpoint_(std::move(endpoint)), options_(options) {}

Connection::~Connection() {
    disconnect();
}

void Connection::connect() {
    if (state_ == ConnectionState::Connected) {
        return;
    }

    if (socket_fd_ >= 0) {
        ::close(socket_fd_);
        socket_fd_ = -1;
    }
    buffer_.clear();

    // one deadline covers resolve + connect + handshake
    auto deadline = util::deadline_after(options_.connect_timeout);

    PAPER_LOG_DEBUG("connecting to " + endpoint_.to_string());
    socket_fd_ = open_socket(deadline);
    state_ = ConnectionState::Connected;
    last_error_.clear();

    // the server speaks first: one ack, or an error if it refuses us
    Response handshake = read_response(ResponseShape::Ack, deadline);
    if (!handshake.ok()) {
        ErrorReply reply = std::move(*handshake.error);
        fault("handshake rejected: " + reply.message);
        throw ProtocolError("CONNECT", std::move(reply));
    }

    PAPER_LOG_INFO("connected to " + endpoint_.to_string());
}

void Connection::disconnect() noexcept {
    if (socket_fd_ >= 0) {
        ::close(socket_fd_);
        socket_fd_ = -1;
    }
    if (state_ == ConnectionState::Connected) {
        PAPER_LOG_DEBUG("disconnected from " + endpoint_.to_string());
    }
    state_ = ConnectionState::Disconnected;
    last_error_.clear();
    buffer_.clear();
}

Response Connection::round_trip(const Command& command) {
    if (state_ == ConnectionState::Faulted) {
        throw ConnectionError("connection to " + endpoint_.to_string() + " is faulted (" +
                              last_error_ + "), reconnect first");
    }
    if (state_ != ConnectionState::Connected) {
        throw ConnectionError("not connected to " + endpoint_.to_string());
    }

    // encode before touching the socket: a malformed command must not reach the wire
    std::vector<uint8_t> request = WireCodec::encode_request(command);

    // bytes nobody asked for mean we lost track of frame boundaries
    if (!buffer_.empty()) {
        fault("unsolicited bytes from server");
        throw CodecError(last_error_);
    }

    auto deadline = util::deadline_after(options_.timeout);
    PAPER_LOG_DEBUG(std::string(command_name(command)) + " -> " + endpoint_.to_string() + " (" +
                    std::to_string(request.size()) + " bytes)");

    send_all(request, deadline);
    return read_response(response_shape(command), deadline);
}

int Connection::open_socket(const util::Deadline& deadline) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    std::string port = std::to_string(endpoint_.port);
    addrinfo* result = nullptr;
    int rc = getaddrinfo(endpoint_.host.c_str(), port.c_str(), &hints, &result);
    if (rc != 0 || result == nullptr) {
        fault("cannot resolve " + endpoint_.host + ": " + gai_strerror(rc));
        throw ConnectionError(last_error_);
    }
    std::unique_ptr<addrinfo, AddrInfoDeleter> guard(result);

    std::string reason = "no usable address";

    // try each resolved address until one connects (v4 and v6 for "localhost")
    for (addrinfo* ai = result; ai != nullptr; ai = ai->ai_next) {
        int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
        if (fd < 0) {
            reason = errno_string("socket");
            continue;
        }

        ConnectResult connected = connect_socket(fd, ai, deadline, reason);
        if (connected == ConnectResult::Connected) {
            // requests are small and we wait on every reply, so don't let nagle hold them
            int opt = 1;
            if (setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &opt, sizeof(opt)) < 0) {
                reason = errno_string("setsockopt(TCP_NODELAY)");
                ::close(fd);
                continue;
            }
            return fd;
        }

        ::close(fd);
        if (connected == ConnectResult::TimedOut) {
            fault("connect to " + endpoint_.to_string() + " timed out");
            throw TimeoutError(last_error_);
        }
    }

    fault("failed to connect to " + endpoint_.to_string() + ": " + reason);
    throw ConnectionError(last_error_);
}

void Connection::send_all(const std::vector<uint8_t>& bytes, const util::Deadline& deadline) {
    size_t total_sent = 0;

    // loop until all bytes are sent; a short write is never left half done
    while (total_sent < bytes.size()) {
        wait_for(POLLOUT, deadline, "request to be written");

        // MSG_NOSIGNAL: a closed peer gives EPIPE instead of killing the process with SIGPIPE
        ssize_t sent = ::send(socket_fd_, bytes.data() + total_sent, bytes.size() - total_sent,
                              MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EINTR) {
                continue;
            }
            fault(errno_string("send"));
            throw ConnectionError(last_error_);
        }
        if (sent == 0) {
            fault("send: connection closed");
            throw ConnectionError(last_error_);
        }
        total_sent += static_cast<size_t>(sent);
    }
}

Response Connection::read_response(ResponseShape shape, const util::Deadline& deadline) {
    uint8_t chunk[4096];

    while (true) {
        size_t consumed = 0;
        std::optional<Response> response;
        try {
            response = WireCodec::decode_response(shape, buffer_, consumed);
        } catch (const CodecError& e) {
            fault(std::string("invalid response: ") + e.what());
            throw;
        }

        if (response) {
            buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(consumed));
            return std::move(*response);
        }

        // frame incomplete: wait for more bytes
        wait_for(POLLIN, deadline, "response");

        ssize_t n = ::recv(socket_fd_, chunk, sizeof(chunk), 0);
        if (n == 0) {
            fault(buffer_.empty() ? "connection closed by server"
                                  : "connection closed by server mid-response");
            throw ConnectionError(last_error_);
        }
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            fault(errno_string("recv"));
            throw ConnectionError(last_error_);
        }
        buffer_.insert(buffer_.end(), chunk, chunk + n);
    }
}

void Connection::wait_for(short events, const util::Deadline& deadline, std::string_view what) {
    if (!deadline) {
        return;  // no timeout configured: the blocking call itself waits
    }

    pollfd pfd{socket_fd_, events, 0};
    while (true) {
        int rc = poll(&pfd, 1, util::remaining_ms(deadline));
        if (rc > 0) {
            return;  // ready, or an error/hangup the following send/recv will report
        }
        if (rc == 0) {
            fault("timed out waiting for " + std::string(what));
            throw TimeoutError(last_error_);
        }
        if (errno != EINTR) {
            fault(errno_string("poll"));
            throw ConnectionError(last_error_);
        }
    }
}

void Connection::fault(const std::string& reason) {
    if (socket_fd_ >= 0) {
        ::close(socket_fd_);
        socket_fd_ = -1;
    }
    buffer_.clear();
    state_ = ConnectionState::Faulted;
    last_error_ = reason;
    PAPER_LOG_WARN(endpoint_.to_string() + ": " + reason);
}

}  // namespace paper::net
