#ifndef XFER_TRANSFER_PEERNOTIFIER_HPP_
#define XFER_TRANSFER_PEERNOTIFIER_HPP_

#include <chrono>
#include <memory>

#include "transfererror.hpp"

namespace xfer::wormhole
{
// Forward declarations
class Wormhole;
}  // namespace xfer::wormhole

namespace xfer::protocol
{
// Forward declarations
class MessageCodec;
}  // namespace xfer::protocol

namespace xfer::transfer
{
/**
 * Tells the peer that the transfer failed on our side.
 *
 * Fire and forget: an Error message carrying the rendered error is sent and the send is
 * waited for at most notify_timeout. Whether it arrived is logged and otherwise ignored, so
 * the caller always returns its original error. Errors the peer reported itself are not
 * echoed back.
 */
class PeerNotifier
{
public:
    PeerNotifier(
        std::shared_ptr<const protocol::MessageCodec> codec, std::chrono::milliseconds notify_timeout);

    void notify(wormhole::Wormhole &wormhole, const TransferError &error) const;

private:
    const std::shared_ptr<const protocol::MessageCodec> codec_;
    const std::chrono::milliseconds                     notify_timeout_;
};
}  // namespace xfer::transfer

#endif  // XFER_TRANSFER_PEERNOTIFIER_HPP_
