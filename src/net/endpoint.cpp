#include "paper/net/endpoint.hpp"

#include <charconv>
#include <system_error>

#include "paper/errors.hpp"

namespace paper::net {

std::string Endpoint::to_string() const {
    std::string out = std::string(kScheme) + "://";
    if (host.find(':') != std::string::npos) {
        out += "[" + host + "]";
    } else {
        out += host;
    }
    return out + ":" + std::to_string(port);
}

Endpoint parse_endpoint(std::string_view address) {
    auto fail = [&](const std::string& why) {
        return AddressError("invalid address '" + std::string(address) + "': " + why);
    };

    size_t sep = address.find("://");
    if (sep == std::string_view::npos) {
        throw fail("missing scheme");
    }
    if (address.substr(0, sep) != kScheme) {
        throw fail("scheme must be '" + std::string(kScheme) + "'");
    }

    std::string_view rest = address.substr(sep + 3);
    std::string_view host;
    std::string_view port_text;

    if (!rest.empty() && rest.front() == '[') {
        // [v6 literal]:port
        size_t close = rest.find(']');
        if (close == std::string_view::npos) {
            throw fail("unterminated '['");
        }
        host = rest.substr(1, close - 1);
        rest = rest.substr(close + 1);
        if (rest.empty() || rest.front() != ':') {
            throw fail("missing port");
        }
        port_text = rest.substr(1);
    } else {
        size_t colon = rest.find(':');
        if (colon == std::string_view::npos) {
            throw fail("missing port");
        }
        host = rest.substr(0, colon);
        port_text = rest.substr(colon + 1);
        if (port_text.find(':') != std::string_view::npos) {
            throw fail("ipv6 hosts must be written in brackets");
        }
    }

    if (host.empty()) {
        throw fail("missing host");
    }
    if (port_text.empty()) {
        throw fail("missing port");
    }

    // from_chars: no sign, no whitespace, no locale. must consume every character
    unsigned long port = 0;
    auto [end, ec] = std::from_chars(port_text.data(), port_text.data() + port_text.size(), port);
    if (ec != std::errc() || end != port_text.data() + port_text.size()) {
        throw fail("port must be numeric");
    }
    if (port == 0 || port > 65535) {
        throw fail("port out of range");
    }

    return Endpoint{std::string(host), static_cast<uint16_t>(port)};
}

}  // namespace paper::net
