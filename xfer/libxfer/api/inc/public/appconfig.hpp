#ifndef XFER_API_APPCONFIG_HPP_
#define XFER_API_APPCONFIG_HPP_

#include <string>

#include "appversion.hpp"

namespace xfer
{
// Everything a wormhole client needs to know to talk to the peer and to the servers
struct AppConfig
{
    std::string          id;
    std::string          rendezvous_url;
    std::string          relay_url;
    protocol::AppVersion app_version;
};
}  // namespace xfer

#endif  // XFER_API_APPCONFIG_HPP_
