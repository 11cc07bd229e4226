#ifndef XFER_TRANSFER_FILESENDER_HPP_
#define XFER_TRANSFER_FILESENDER_HPP_

#include <cstdint>
#include <functional>
#include <istream>
#include <memory>
#include <string>

#include "bulktransfer.hpp"
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
class TransitInitializer;
}  // namespace xfer::transit

namespace xfer::protocol
{
// Forward declarations
class MessageCodec;
}  // namespace xfer::protocol

namespace xfer::transfer
{
// Forward declarations
class PeerNotifier;

/**
 * Sending side of a transfer. One instance drives one offer over one wormhole.
 *
 * Conversation: our Transit, our Offer, their Transit, their Answer, then the payload over
 * transit. The wormhole is closed once the payload was acknowledged. On any local failure
 * the peer is notified before the error is returned.
 */
class FileSender
{
public:
    enum class State
    {
        START,
        TRANSIT_NEGOTIATED,
        OFFER_SENT,
        ACKED,
        TRANSFERRING,
        CLOSED,
        FAILED
    };

    FileSender(std::unique_ptr<wormhole::Wormhole>  wormhole,
        std::shared_ptr<transit::TransitInitializer>  transit_initializer,
        std::shared_ptr<const protocol::MessageCodec> codec,
        std::shared_ptr<bulk::BulkTransfer> bulk_transfer_v1,
        std::shared_ptr<const PeerNotifier> peer_notifier);
    ~FileSender();

    FileSender(const FileSender &) = delete;
    FileSender &operator=(const FileSender &) = delete;

    // Sends size bytes read from source, offered as display_name
    bool send_file(const std::string &relay_url, std::istream &source,
        const std::string &display_name, uint64_t size,
        const bulk::ProgressHandler &progress_handler, TransferError &error);

    // Sends the folder as a zip archive, offered as display_name
    bool send_folder(const std::string &relay_url, const std::string &folder_path,
        const std::string &display_name, const bulk::ProgressHandler &progress_handler,
        TransferError &error);

    [[nodiscard]] State state() const;

private:
    bool run(const std::string &relay_url, const protocol::OfferVariant &offer,
        std::istream &source, uint64_t size, const bulk::ProgressHandler &progress_handler,
        const std::function<bool()> &source_skewed, TransferError &error);
    bool fail(TransferError reason, TransferError &error);
    void set_state(State state);

    const std::unique_ptr<wormhole::Wormhole>           wormhole_;
    const std::shared_ptr<transit::TransitInitializer>  transit_initializer_;
    const std::shared_ptr<const protocol::MessageCodec> codec_;
    const std::shared_ptr<bulk::BulkTransfer>           bulk_transfer_v1_;
    const std::shared_ptr<const PeerNotifier>           peer_notifier_;
    State                                               state_;
};

const char *to_string(FileSender::State state);
}  // namespace xfer::transfer

#endif  // XFER_TRANSFER_FILESENDER_HPP_
