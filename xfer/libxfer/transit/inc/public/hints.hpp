#ifndef XFER_TRANSIT_HINTS_HPP_
#define XFER_TRANSIT_HINTS_HPP_

#include <cstdint>
#include <string>
#include <vector>

namespace xfer::transit
{
struct DirectHint
{
    std::string hostname;
    uint16_t    port {};
    double      priority {};

    bool operator==(const DirectHint &rhs) const
    {
        return hostname == rhs.hostname && port == rhs.port && priority == rhs.priority;
    }

    bool operator!=(const DirectHint &rhs) const
    {
        return !(*this == rhs);
    }
};

struct RelayHint
{
    // Optional human readable name, empty if not set
    std::string             name;
    std::vector<DirectHint> tcp;
    // Websocket relay endpoints. Not part of the hints-v1 wire format.
    std::vector<std::string> ws;

    /**
     * Builds a relay hint out of relay server URLs.
     *
     * tcp://host:port URLs become TCP hints, ws:// and wss:// URLs are kept verbatim.
     * Returns false if any URL has another scheme or no valid host and port.
     */
    static bool from_urls(
        const std::string &name, const std::vector<std::string> &urls, RelayHint &hint);

    bool operator==(const RelayHint &rhs) const
    {
        return name == rhs.name && tcp == rhs.tcp && ws == rhs.ws;
    }

    bool operator!=(const RelayHint &rhs) const
    {
        return !(*this == rhs);
    }
};

struct Hints
{
    std::vector<DirectHint> direct_tcp;
    std::vector<RelayHint>  relay;

    bool operator==(const Hints &rhs) const
    {
        return direct_tcp == rhs.direct_tcp && relay == rhs.relay;
    }

    bool operator!=(const Hints &rhs) const
    {
        return !(*this == rhs);
    }
};

namespace conversion
{
// Splits "scheme://host:port[/path]" into its parts. IPv6 hosts must be bracketed.
bool parse_url(const std::string &url, std::string &scheme, std::string &host, uint16_t &port);
}  // namespace conversion
}  // namespace xfer::transit

#endif  // XFER_TRANSIT_HINTS_HPP_
