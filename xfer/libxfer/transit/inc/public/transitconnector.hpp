#ifndef XFER_TRANSIT_TRANSITCONNECTOR_HPP_
#define XFER_TRANSIT_TRANSITCONNECTOR_HPP_

#include <array>
#include <cstdint>
#include <future>
#include <memory>

#include "abilities.hpp"
#include "hints.hpp"
#include "transitchannel.hpp"

namespace xfer::transit
{
using TransitKey = std::array<uint8_t, 32>;

/**
 * A transit endpoint that has been set up (listening sockets, relay hints) but not yet
 * connected to the peer.
 *
 * The leader and follower roles decide who picks the winning connection. Both connect
 * calls resolve to nullptr on failure.
 */
class TransitConnector
{
public:
    virtual ~TransitConnector() = default;

    [[nodiscard]] virtual Abilities                    our_abilities() const = 0;
    [[nodiscard]] virtual std::shared_ptr<const Hints> our_hints() const     = 0;

    virtual std::future<std::unique_ptr<TransitChannel>> leader_connect(const TransitKey &key,
        Abilities their_abilities, std::shared_ptr<const Hints> their_hints)   = 0;
    virtual std::future<std::unique_ptr<TransitChannel>> follower_connect(const TransitKey &key,
        Abilities their_abilities, std::shared_ptr<const Hints> their_hints) = 0;
};
}  // namespace xfer::transit

#endif  // XFER_TRANSIT_TRANSITCONNECTOR_HPP_
