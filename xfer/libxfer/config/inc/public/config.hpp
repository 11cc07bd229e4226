#ifndef XFER_CONFIG_CONFIG_HPP_
#define XFER_CONFIG_CONFIG_HPP_

#include <any>
#include <array>
#include <chrono>
#include <memory>
#include <string>

#include "configkeys.hpp"
#include "fallbackconfigvalueprovider.hpp"

namespace xfer::config
{
class ConfigLoader;

/**
 * Settings loaded once at construction.
 *
 * A value that is missing or has the wrong type is taken from the fallback provider. A
 * setting that has no usable fallback either is a programming error and aborts.
 */
class Config
{
public:
    explicit Config(const ConfigLoader              &config_loader,
        std::unique_ptr<FallbackConfigValueProvider> fallback_value_provider = nullptr);

    [[nodiscard]] std::string get_string(ConfigKey key) const;
    [[nodiscard]] long long   get_integer(ConfigKey key) const;

    // Integer value in milliseconds, negative values are clamped to zero
    [[nodiscard]] std::chrono::milliseconds get_duration(ConfigKey key) const;

private:
    template<typename T>
    T get(ConfigKey key) const;

    template<typename T>
    T get_fallback(ConfigKey key) const;

    std::array<std::any, ConfigKey::KEY_COUNT> values_;
    // shared so that a Config object stays copyable
    std::shared_ptr<const FallbackConfigValueProvider> fallback_value_provider_;
};
}  // namespace xfer::config

#endif  // XFER_CONFIG_CONFIG_HPP_
