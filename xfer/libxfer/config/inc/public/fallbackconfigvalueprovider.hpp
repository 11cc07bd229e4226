#ifndef XFER_CONFIG_FALLBACKCONFIGVALUEPROVIDER_HPP_
#define XFER_CONFIG_FALLBACKCONFIGVALUEPROVIDER_HPP_

#include <any>

namespace xfer::config
{
// Forward declarations
class ConfigKey;

// Supplies a value for every key the loaded configuration lacks or has mistyped
class FallbackConfigValueProvider
{
public:
    virtual ~FallbackConfigValueProvider() = default;

    [[nodiscard]] virtual std::any get(const ConfigKey &key) const = 0;
};
}  // namespace xfer::config

#endif  // XFER_CONFIG_FALLBACKCONFIGVALUEPROVIDER_HPP_
