#ifndef XFER_TRANSFER_FILERECEIVER_HPP_
#define XFER_TRANSFER_FILERECEIVER_HPP_

#include <memory>
#include <string>

#include "transfererror.hpp"

namespace xfer::wormhole
{
// Forward declarations
class Wormhole;
}  // namespace xfer::wormhole

namespace xfer::transit
{
// Forward declarations
class TransitInitializer;
}  // namespace xfer::transit

namespace xfer::protocol
{
// Forward declarations
class MessageCodec;
}  // namespace xfer::protocol

namespace xfer::bulk
{
// Forward declarations
class BulkTransfer;
}  // namespace xfer::bulk

namespace xfer::transfer
{
// Forward declarations
class PeerNotifier;
class ReceiveRequest;

/**
 * Receiving side of a transfer, up to the point where the user decides on the offer.
 *
 * Conversation: our Transit, their Transit, their Offer. On success the wormhole and the
 * transit endpoint move into the returned ReceiveRequest.
 */
class FileReceiver
{
public:
    enum class State
    {
        START,
        TRANSIT_NEGOTIATED,
        OFFER_PENDING,
        ACCEPTED,
        REJECTED,
        CLOSED,
        FAILED
    };

    FileReceiver(std::unique_ptr<wormhole::Wormhole>  wormhole,
        std::shared_ptr<transit::TransitInitializer>  transit_initializer,
        std::shared_ptr<const protocol::MessageCodec> codec,
        std::shared_ptr<bulk::BulkTransfer> bulk_transfer_v1,
        std::shared_ptr<const PeerNotifier> peer_notifier);
    ~FileReceiver();

    FileReceiver(const FileReceiver &) = delete;
    FileReceiver &operator=(const FileReceiver &) = delete;

    // Returns nullptr and fills error if no acceptable offer arrived
    std::unique_ptr<ReceiveRequest> request(const std::string &relay_url, TransferError &error);

    [[nodiscard]] State state() const;

private:
    std::unique_ptr<ReceiveRequest> fail(TransferError reason, TransferError &error);
    void                            set_state(State state);

    std::unique_ptr<wormhole::Wormhole>                 wormhole_;
    const std::shared_ptr<transit::TransitInitializer>  transit_initializer_;
    const std::shared_ptr<const protocol::MessageCodec> codec_;
    const std::shared_ptr<bulk::BulkTransfer>           bulk_transfer_v1_;
    const std::shared_ptr<const PeerNotifier>           peer_notifier_;
    State                                               state_;
};

const char *to_string(FileReceiver::State state);
}  // namespace xfer::transfer

#endif  // XFER_TRANSFER_FILERECEIVER_HPP_
