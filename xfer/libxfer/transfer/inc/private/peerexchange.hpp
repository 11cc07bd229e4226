#ifndef XFER_TRANSFER_PEEREXCHANGE_HPP_
#define XFER_TRANSFER_PEEREXCHANGE_HPP_

#include <memory>
#include <string>

#include "appversion.hpp"
#include "peermessages.hpp"
#include "transfererror.hpp"

namespace xfer::wormhole
{
// Forward declarations
class Wormhole;
}  // namespace xfer::wormhole

namespace xfer::transit
{
// Forward declarations
class TransitConnector;
class TransitInitializer;
}  // namespace xfer::transit

namespace xfer::protocol
{
// Forward declarations
class MessageCodec;
}  // namespace xfer::protocol

// Steps shared by the sending and the receiving side of a transfer
namespace xfer::transfer::exchange
{
bool send_message(wormhole::Wormhole &wormhole, const protocol::MessageCodec &codec,
    const protocol::PeerMessage &message, TransferError &error);

bool receive_message(wormhole::Wormhole &wormhole, const protocol::MessageCodec &codec,
    protocol::PeerMessage &message, TransferError &error);

// Validates the peer's application version and picks the bulk transfer generation
bool negotiate_generation(const wormhole::Wormhole &wormhole,
    protocol::ProtocolGeneration &generation, TransferError &error);

// Sets up a transit endpoint advertising every ability and the relay behind relay_url
bool open_transit(transit::TransitInitializer &initializer, const std::string &relay_url,
    std::unique_ptr<transit::TransitConnector> &connector, TransferError &error);
}  // namespace xfer::transfer::exchange

#endif  // XFER_TRANSFER_PEEREXCHANGE_HPP_
