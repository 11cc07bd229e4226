#ifndef XFER_WORMHOLE_WORMHOLE_HPP_
#define XFER_WORMHOLE_WORMHOLE_HPP_

#include <cstdint>
#include <future>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "transitconnector.hpp"

namespace xfer::wormhole
{
/**
 * An established, encrypted wormhole connection to the peer.
 *
 * The key exchange and the rendezvous mailbox protocol happen before an instance reaches
 * this library. Failed operations resolve to false or to an empty optional. Returned
 * futures must not block in their destructor since the library may abandon a future it
 * has given up waiting on.
 */
class Wormhole
{
public:
    using Bytes = std::vector<uint8_t>;

    virtual ~Wormhole() = default;

    virtual std::future<bool>                 send(Bytes message) = 0;
    virtual std::future<std::optional<Bytes>> receive()           = 0;
    virtual std::future<bool>                 close()             = 0;

    [[nodiscard]] virtual std::string app_id() const = 0;

    // Key for the transit layer, derived from the wormhole's shared secret
    [[nodiscard]] virtual transit::TransitKey derive_transit_key(
        const std::string &app_id) const = 0;

    // The application version record the peer sent during the handshake, not yet validated
    [[nodiscard]] virtual nlohmann::json peer_version() const = 0;
};
}  // namespace xfer::wormhole

#endif  // XFER_WORMHOLE_WORMHOLE_HPP_
