#ifndef PAPER_NET_ENDPOINT_HPP
#define PAPER_NET_ENDPOINT_HPP

#include <cstdint>
#include <string>
#include <string_view>

namespace paper::net {

inline constexpr std::string_view kScheme = "paper";
inline constexpr uint16_t kDefaultPort = 3145;

struct Endpoint {
    std::string host;
    uint16_t port = kDefaultPort;

    // back to "paper://host:port" (ipv6 hosts in brackets)
    [[nodiscard]] std::string to_string() const;
};

/*
    parses "paper://<host>:<port>". throws AddressError on:
        - any scheme other than "paper"
        - empty host, or an unbracketed host containing ':'
        - missing, non-numeric or out of range (1..65535) port
        - anything trailing the port
*/
[[nodiscard]] Endpoint parse_endpoint(std::string_view address);

}  // namespace paper::net

#endif
