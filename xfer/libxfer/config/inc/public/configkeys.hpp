#ifndef XFER_CONFIG_CONFIGKEYS_HPP_
#define XFER_CONFIG_CONFIGKEYS_HPP_

#include <string>

namespace xfer::config
{
class ConfigKey
{
public:
    enum EnumType
    {
        FIRST_KEY = 0,

        RENDEZVOUS_URL = FIRST_KEY,
        RELAY_URL,
        TRANSFER_CHUNK_SIZE,
        TRANSIT_ACK_TIMEOUT,
        PEER_ERROR_NOTIFY_TIMEOUT,

        KEY_COUNT
    };

    // Unrecognized names map to KEY_COUNT
    ConfigKey(const std::string &str_key);

    ConfigKey(EnumType k)
        : key_ {k}
    {}

    [[nodiscard]] std::string to_string() const
    {
        if (key_ >= 0 && key_ < KEY_COUNT)
        {
            return string_vals[key_];
        }
        return "";
    }

    [[nodiscard]] EnumType to_enum_type() const
    {
        return key_;
    }

    operator EnumType() const
    {
        return to_enum_type();
    }

    explicit operator std::string() const
    {
        return to_string();
    }

private:
    EnumType key_;

    static constexpr char const *string_vals[] {"rendezvous_url", "relay_url",
        "transfer_chunk_size", "transit_ack_timeout", "peer_error_notify_timeout"};
};
}  // namespace xfer::config

#endif  // XFER_CONFIG_CONFIGKEYS_HPP_
