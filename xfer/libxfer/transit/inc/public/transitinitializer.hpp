#ifndef XFER_TRANSIT_TRANSITINITIALIZER_HPP_
#define XFER_TRANSIT_TRANSITINITIALIZER_HPP_

#include <future>
#include <memory>
#include <vector>

#include "abilities.hpp"
#include "hints.hpp"
#include "transitconnector.hpp"

namespace xfer::transit
{
class TransitInitializer
{
public:
    virtual ~TransitInitializer() = default;

    // Resolves to nullptr if no transit endpoint could be set up
    virtual std::future<std::unique_ptr<TransitConnector>> init(
        Abilities abilities, std::vector<RelayHint> relay_hints) = 0;
};
}  // namespace xfer::transit

#endif  // XFER_TRANSIT_TRANSITINITIALIZER_HPP_
