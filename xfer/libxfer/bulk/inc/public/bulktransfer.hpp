#ifndef XFER_BULK_BULKTRANSFER_HPP_
#define XFER_BULK_BULKTRANSFER_HPP_

#include <cstdint>
#include <functional>
#include <istream>
#include <ostream>

#include "transfererror.hpp"
#include "transitchannel.hpp"

namespace xfer::bulk
{
using ProgressHandler = std::function<void(uint64_t bytes_transferred, uint64_t total_bytes)>;

/**
 * Moves the payload of an accepted offer over a connected transit channel.
 *
 * One implementation exists per protocol generation. Both calls return false and fill
 * error on failure.
 */
class BulkTransfer
{
public:
    virtual ~BulkTransfer() = default;

    virtual bool send(transit::TransitChannel &channel, std::istream &source, uint64_t size,
        const ProgressHandler &progress_handler, transfer::TransferError &error) = 0;
    virtual bool receive(transit::TransitChannel &channel, uint64_t size,
        const ProgressHandler &progress_handler, std::ostream &sink,
        transfer::TransferError &error) = 0;
};
}  // namespace xfer::bulk

#endif  // XFER_BULK_BULKTRANSFER_HPP_
