#ifndef XFER_CONFIG_CONFIGLOADER_HPP_
#define XFER_CONFIG_CONFIGLOADER_HPP_

#include <any>
#include <map>
#include <string>

namespace xfer::config
{
class ConfigLoader
{
public:
    virtual ~ConfigLoader() = default;

    [[nodiscard]] virtual std::map<std::string, std::any> load() const = 0;
};
}  // namespace xfer::config

#endif  // XFER_CONFIG_CONFIGLOADER_HPP_
