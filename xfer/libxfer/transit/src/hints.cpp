#include "hints.hpp"

#include <algorithm>
#include <cctype>

#include <glog/logging.h>

namespace xfer::transit
{
namespace conversion
{
bool parse_url(const std::string &url, std::string &scheme, std::string &host, uint16_t &port)
{
    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos || scheme_end == 0)
    {
        return false;
    }

    std::string authority = url.substr(scheme_end + 3);
    authority             = authority.substr(0, authority.find('/'));

    std::string port_str;
    if (!authority.empty() && authority.front() == '[')
    {
        auto closing = authority.find(']');
        if (closing == std::string::npos || closing + 1 >= authority.size() ||
            authority[closing + 1] != ':')
        {
            return false;
        }
        host     = authority.substr(1, closing - 1);
        port_str = authority.substr(closing + 2);
    }
    else
    {
        auto colon = authority.rfind(':');
        if (colon == std::string::npos)
        {
            return false;
        }
        host     = authority.substr(0, colon);
        port_str = authority.substr(colon + 1);
    }

    if (host.empty() || port_str.empty() || port_str.size() > 5 ||
        !std::all_of(port_str.cbegin(), port_str.cend(),
            [](char c) { return std::isdigit(static_cast<unsigned char>(c)); }))
    {
        return false;
    }

    unsigned long port_value = std::stoul(port_str);
    if (port_value == 0 || port_value > 65535)
    {
        return false;
    }

    scheme = url.substr(0, scheme_end);
    std::transform(scheme.begin(), scheme.end(), scheme.begin(),
        [](unsigned char c) { return char(std::tolower(c)); });
    port = uint16_t(port_value);
    return true;
}
}  // namespace conversion

bool RelayHint::from_urls(
    const std::string &name, const std::vector<std::string> &urls, RelayHint &hint)
{
    RelayHint result;
    result.name = name;

    for (const auto &url : urls)
    {
        std::string scheme;
        std::string host;
        uint16_t    port;
        if (!conversion::parse_url(url, scheme, host, port))
        {
            LOG(WARNING) << "Malformed relay URL " << url;
            return false;
        }

        if (scheme == "tcp")
        {
            result.tcp.push_back({host, port, 0.0});
        }
        else if (scheme == "ws" || scheme == "wss")
        {
            result.ws.push_back(url);
        }
        else
        {
            LOG(WARNING) << "Unsupported relay URL scheme " << scheme;
            return false;
        }
    }

    hint = std::move(result);
    return true;
}
}  // namespace xfer::transit
