#ifndef XFER_PROTOCOL_MESSAGECODECIMPL_HPP_
#define XFER_PROTOCOL_MESSAGECODECIMPL_HPP_

#include "messagecodec.hpp"

namespace xfer::protocol
{
/**
 * Peer messages travel as UTF-8 JSON objects over the wormhole. The transit
 * acknowledgment is a msgpack map.
 */
class MessageCodecImpl : public MessageCodec
{
public:
    [[nodiscard]] std::vector<uint8_t> encode(const PeerMessage &message) const override;
    bool decode(const std::vector<uint8_t> &bytes, PeerMessage &message,
        transfer::TransferError &error) const override;

    [[nodiscard]] std::vector<uint8_t> encode(const TransitAck &ack) const override;
    bool decode(const std::vector<uint8_t> &bytes, TransitAck &ack,
        transfer::TransferError &error) const override;
};
}  // namespace xfer::protocol

#endif  // XFER_PROTOCOL_MESSAGECODECIMPL_HPP_
