#ifndef XFER_TRANSIT_TRANSITCHANNEL_HPP_
#define XFER_TRANSIT_TRANSITCHANNEL_HPP_

#include <cstdint>
#include <future>
#include <optional>
#include <vector>

namespace xfer::transit
{
/**
 * A connected, encrypted transit connection.
 *
 * Records are delivered reliably and in order. A failed operation resolves to false
 * (send) or to an empty optional (receive); implementations log the reason.
 */
class TransitChannel
{
public:
    using Record = std::vector<uint8_t>;

    virtual ~TransitChannel() = default;

    virtual std::future<bool>                  send_record(Record record) = 0;
    virtual std::future<std::optional<Record>> receive_record()           = 0;
};
}  // namespace xfer::transit

#endif  // XFER_TRANSIT_TRANSITCHANNEL_HPP_
