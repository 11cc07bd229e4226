#include "config.hpp"

#include <algorithm>
#include <iterator>
#include <typeinfo>

#include <glog/logging.h>

#include "configloader.hpp"

namespace xfer::config
{
ConfigKey::ConfigKey(const std::string &str_key)
    : key_ {KEY_COUNT}
{
    auto it = std::find(std::begin(string_vals), std::end(string_vals), str_key);
    if (it != std::end(string_vals))
    {
        key_ = EnumType(std::distance(std::begin(string_vals), it));
    }
}

Config::Config(const ConfigLoader                &config_loader,
    std::unique_ptr<FallbackConfigValueProvider> fallback_value_provider)
    : fallback_value_provider_ {std::move(fallback_value_provider)}
{
    for (auto &[name, value] : config_loader.load())
    {
        ConfigKey key {name};
        if (key == ConfigKey::KEY_COUNT)
        {
            LOG(WARNING) << "Ignoring unknown config key " << name;
            continue;
        }
        values_[key] = std::move(value);
    }
}

std::string Config::get_string(ConfigKey key) const
{
    return get<std::string>(key);
}

long long Config::get_integer(ConfigKey key) const
{
    return get<long long>(key);
}

std::chrono::milliseconds Config::get_duration(ConfigKey key) const
{
    return std::chrono::milliseconds {std::max(get<long long>(key), 0LL)};
}

template<typename T>
T Config::get(ConfigKey key) const
{
    if (key < 0 || key >= ConfigKey::KEY_COUNT)
    {
        LOG(FATAL) << "Invalid config key " << key;
    }

    const std::any &value = values_[key];
    if (auto typed = std::any_cast<T>(&value))
    {
        return *typed;
    }

    if (value.has_value())
    {
        LOG(ERROR) << "Config value " << key.to_string() << " is a " << value.type().name()
                   << " instead of a " << typeid(T).name() << ", using the default";
    }
    else
    {
        LOG(INFO) << "Config value " << key.to_string() << " not set, using the default";
    }
    return get_fallback<T>(key);
}

template<typename T>
T Config::get_fallback(ConfigKey key) const
{
    if (!fallback_value_provider_)
    {
        LOG(FATAL) << "No default for config value " << key.to_string()
                   << ", fallback value provider is missing";
    }

    std::any value = fallback_value_provider_->get(key);
    auto     typed = std::any_cast<T>(&value);
    if (!typed)
    {
        LOG(FATAL) << "Default for config value " << key.to_string() << " is missing or not a "
                   << typeid(T).name();
    }
    return *typed;
}
}  // namespace xfer::config
