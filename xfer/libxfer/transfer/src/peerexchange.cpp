#include "peerexchange.hpp"

#include <glog/logging.h>

#include "messagecodec.hpp"
#include "transitinitializer.hpp"
#include "wormhole.hpp"

namespace xfer::transfer::exchange
{
bool send_message(wormhole::Wormhole &wormhole, const protocol::MessageCodec &codec,
    const protocol::PeerMessage &message, TransferError &error)
{
    auto name = protocol::message_name(message);
    if (!wormhole.send(codec.encode(message)).get())
    {
        LOG(ERROR) << "Sending " << name << " message failed";
        error = TransferError::channel(std::string {"failed to send "} + name + " message");
        return false;
    }

    LOG(INFO) << "Sent " << name << " message";
    return true;
}

bool receive_message(wormhole::Wormhole &wormhole, const protocol::MessageCodec &codec,
    protocol::PeerMessage &message, TransferError &error)
{
    auto bytes = wormhole.receive().get();
    if (!bytes)
    {
        LOG(ERROR) << "Wormhole closed while waiting for a peer message";
        error = TransferError::channel("connection closed while waiting for a message");
        return false;
    }

    if (!codec.decode(*bytes, message, error))
    {
        LOG(ERROR) << "Could not decode peer message: " << error.describe();
        return false;
    }

    LOG(INFO) << "Received " << protocol::message_name(message) << " message";
    return true;
}

bool negotiate_generation(const wormhole::Wormhole &wormhole,
    protocol::ProtocolGeneration &generation, TransferError &error)
{
    protocol::AppVersion their_version;
    if (!protocol::decode_peer_app_version(wormhole.peer_version(), their_version, error))
    {
        return false;
    }

    generation = protocol::select_protocol_generation(protocol::current_app_version(), their_version);
    LOG(INFO) << "Using " << protocol::to_string(generation);

    if (generation != protocol::ProtocolGeneration::V1)
    {
        error = TransferError::protocol("transfer-v2 is not available");
        return false;
    }

    return true;
}

bool open_transit(transit::TransitInitializer &initializer, const std::string &relay_url,
    std::unique_ptr<transit::TransitConnector> &connector, TransferError &error)
{
    transit::RelayHint relay_hint;
    if (!transit::RelayHint::from_urls({}, {relay_url}, relay_hint))
    {
        LOG(ERROR) << "Invalid relay URL " << relay_url;
        error = TransferError::transit_connect("invalid relay URL");
        return false;
    }

    connector = initializer.init(transit::Abilities::all(), {relay_hint}).get();
    if (!connector)
    {
        LOG(ERROR) << "Could not set up a transit endpoint";
        error = TransferError::transit_connect("failed to set up transit");
        return false;
    }

    return true;
}
}  // namespace xfer::transfer::exchange
