#ifndef XFER_PROTOCOL_MESSAGECODEC_HPP_
#define XFER_PROTOCOL_MESSAGECODEC_HPP_

#include <cstdint>
#include <string>
#include <vector>

#include "peermessages.hpp"
#include "transfererror.hpp"

namespace xfer::protocol
{
class MessageCodec
{
public:
    virtual ~MessageCodec() = default;

    virtual std::vector<uint8_t> encode(const PeerMessage &message) const = 0;
    virtual bool decode(const std::vector<uint8_t> &bytes, PeerMessage &message,
        transfer::TransferError &error) const                            = 0;

    virtual std::vector<uint8_t> encode(const TransitAck &ack) const = 0;
    virtual bool decode(const std::vector<uint8_t> &bytes, TransitAck &ack,
        transfer::TransferError &error) const                       = 0;
};

// Debug rendering of a peer message, used in error reports
std::string to_string(const PeerMessage &message);
}  // namespace xfer::protocol

#endif  // XFER_PROTOCOL_MESSAGECODEC_HPP_
