#ifndef XFER_BULK_BULKTRANSFERV1_HPP_
#define XFER_BULK_BULKTRANSFERV1_HPP_

#include <chrono>
#include <cstddef>
#include <memory>

#include "bulktransfer.hpp"

namespace xfer::protocol
{
// Forward declarations
class MessageCodec;
}  // namespace xfer::protocol

namespace xfer::bulk
{
/**
 * transfer-v1: the payload is sent as a sequence of transit records of at most
 * chunk_size bytes. The receiver answers with a TransitAck carrying the hex SHA-256 of
 * everything it received, which the sender checks against its own digest.
 */
class BulkTransferV1 : public BulkTransfer
{
public:
    BulkTransferV1(std::shared_ptr<const protocol::MessageCodec> codec, size_t chunk_size,
        std::chrono::milliseconds ack_timeout);

    bool send(transit::TransitChannel &channel, std::istream &source, uint64_t size,
        const ProgressHandler &progress_handler, transfer::TransferError &error) override;
    bool receive(transit::TransitChannel &channel, uint64_t size,
        const ProgressHandler &progress_handler, std::ostream &sink,
        transfer::TransferError &error) override;

private:
    bool receive_ack(transit::TransitChannel &channel, const std::string &expected_sha256,
        transfer::TransferError &error);

    const std::shared_ptr<const protocol::MessageCodec> codec_;
    const size_t                                        chunk_size_;
    const std::chrono::milliseconds                     ack_timeout_;
};
}  // namespace xfer::bulk

#endif  // XFER_BULK_BULKTRANSFERV1_HPP_
