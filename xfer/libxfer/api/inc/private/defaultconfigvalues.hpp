#ifndef XFER_API_DEFAULTCONFIGVALUES_HPP_
#define XFER_API_DEFAULTCONFIGVALUES_HPP_

#include "configkeys.hpp"
#include "fallbackconfigvalueprovider.hpp"

namespace xfer
{
class DefaultConfigValues : public config::FallbackConfigValueProvider
{
public:
    DefaultConfigValues();
    [[nodiscard]] std::any get(const config::ConfigKey &key) const override;

private:
    const std::any default_values_[config::ConfigKey::KEY_COUNT];
};
}  // namespace xfer

#endif  // XFER_API_DEFAULTCONFIGVALUES_HPP_
