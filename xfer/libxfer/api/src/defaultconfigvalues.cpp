#include "defaultconfigvalues.hpp"

#include <string>

#include <glog/logging.h>

namespace xfer
{
DefaultConfigValues::DefaultConfigValues()
    : default_values_ {/* RENDEZVOUS_URL */ std::string {"ws://relay.magic-wormhole.io:4000/v1"},
          /* RELAY_URL */ std::string {"tcp://transit.magic-wormhole.io:4001"},
          /* TRANSFER_CHUNK_SIZE */ 4096LL,
          /* TRANSIT_ACK_TIMEOUT */ 60LL * 1000 /* = 1 minute */,
          /* PEER_ERROR_NOTIFY_TIMEOUT */ 1000LL /* = 1 second */}
{}

std::any DefaultConfigValues::get(const config::ConfigKey &key) const
{
    if (key < config::ConfigKey::FIRST_KEY || key >= config::ConfigKey::KEY_COUNT)
    {
        LOG(ERROR) << "Invalid key " << key;
        return {};
    }
    return default_values_[key];
}
}  // namespace xfer
