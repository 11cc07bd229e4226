#ifndef XFER_TRANSFER_RECEIVEREQUEST_HPP_
#define XFER_TRANSFER_RECEIVEREQUEST_HPP_

#include <cstdint>
#include <memory>
#include <ostream>
#include <string>

#include "abilities.hpp"
#include "bulktransfer.hpp"
#include "filereceiver.hpp"
#include "hints.hpp"
#include "transfererror.hpp"

namespace xfer::transit
{
// Forward declarations
class TransitConnector;
}  // namespace xfer::transit

namespace xfer::transfer
{
/**
 * A file offer from the peer, waiting for the user's decision.
 *
 * Must be consumed by exactly one call to accept() or reject(). Both take the request by
 * value, so a consumed request no longer exists. Dropping a request without consuming it
 * leaves the peer waiting until the wormhole goes away and is logged as a warning.
 */
class ReceiveRequest
{
public:
    ReceiveRequest(std::unique_ptr<wormhole::Wormhole> wormhole,
        std::unique_ptr<transit::TransitConnector>      connector,
        transit::Abilities their_abilities, std::shared_ptr<const transit::Hints> their_hints,
        std::string filename, uint64_t filesize,
        std::shared_ptr<const protocol::MessageCodec> codec,
        std::shared_ptr<bulk::BulkTransfer>           bulk_transfer_v1,
        std::shared_ptr<const PeerNotifier>           peer_notifier);
    ~ReceiveRequest();

    ReceiveRequest(const ReceiveRequest &) = delete;
    ReceiveRequest &operator=(const ReceiveRequest &) = delete;

    // Untrusted and unverified peer input. Never use it as a path without sanitizing it.
    [[nodiscard]] const std::string &filename() const;
    [[nodiscard]] uint64_t           filesize() const;
    [[nodiscard]] FileReceiver::State state() const;

    // Acknowledges the offer and writes exactly filesize() bytes to sink
    static bool accept(std::unique_ptr<ReceiveRequest> request,
        const bulk::ProgressHandler &progress_handler, std::ostream &sink, TransferError &error);

    // Tells the peer the offer was declined. Transit is never touched.
    static bool reject(std::unique_ptr<ReceiveRequest> request, TransferError &error);

private:
    bool accept_impl(
        const bulk::ProgressHandler &progress_handler, std::ostream &sink, TransferError &error);
    bool reject_impl(TransferError &error);
    bool fail(TransferError reason, TransferError &error);
    void set_state(FileReceiver::State state);

    const std::unique_ptr<wormhole::Wormhole>           wormhole_;
    const std::unique_ptr<transit::TransitConnector>    connector_;
    const transit::Abilities                            their_abilities_;
    const std::shared_ptr<const transit::Hints>         their_hints_;
    const std::string                                   filename_;
    const uint64_t                                      filesize_;
    const std::shared_ptr<const protocol::MessageCodec> codec_;
    const std::shared_ptr<bulk::BulkTransfer>           bulk_transfer_v1_;
    const std::shared_ptr<const PeerNotifier>           peer_notifier_;
    FileReceiver::State                                 state_;
};
}  // namespace xfer::transfer

#endif  // XFER_TRANSFER_RECEIVEREQUEST_HPP_
