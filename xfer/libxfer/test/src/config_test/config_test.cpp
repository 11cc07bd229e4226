#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>

#include "config.hpp"
#include "defaultconfigvalues.hpp"
#include "fallbackconfigvalueprovider.hpp"

#include "configloader_mock.hpp"

using namespace ::testing;
using namespace ::xfer::config;
using namespace ::std::chrono_literals;

namespace
{
class ConfigTest : public Test
{
protected:
    class PartialFallbackValueProvider : public FallbackConfigValueProvider
    {
    public:
        [[nodiscard]] std::any get(const ConfigKey &key) const override
        {
            if (key == ConfigKey::TRANSFER_CHUNK_SIZE)
            {
                return chunk_size_;
            }
            else if (key == ConfigKey::RELAY_URL)
            {
                return std::string {relay_url_};
            }
            return {};
        }

        static constexpr long long   chunk_size_ = 1024LL;
        static constexpr char const *relay_url_  = "tcp://fallback.example.org:4001";
    };

    void SetUp() override
    {
        ON_CALL(config_loader_, load())
            .WillByDefault(Return(std::map<std::string, std::any> {
                {ConfigKey(ConfigKey::RENDEZVOUS_URL).to_string(), rendezvous_url_},
                {ConfigKey(ConfigKey::TRANSIT_ACK_TIMEOUT).to_string(), ack_timeout_},
                {ConfigKey(ConfigKey::RELAY_URL).to_string(), 42LL},
                {"no_such_key", std::string {"ignored"}}}));
    }

    NiceMock<ConfigLoaderMock> config_loader_;

    const std::string rendezvous_url_ = "ws://localhost:4000/v1";
    const long long   ack_timeout_    = 2500LL;
};
}  // namespace

TEST_F(ConfigTest, ConfigKeyNames)
{
    EXPECT_EQ(ConfigKey(ConfigKey::RENDEZVOUS_URL).to_string(), "rendezvous_url");
    EXPECT_EQ(ConfigKey(ConfigKey::PEER_ERROR_NOTIFY_TIMEOUT).to_string(),
        "peer_error_notify_timeout");
    EXPECT_EQ(ConfigKey("transfer_chunk_size"), ConfigKey::TRANSFER_CHUNK_SIZE);
    EXPECT_EQ(ConfigKey("bogus"), ConfigKey::KEY_COUNT);
    EXPECT_EQ(ConfigKey(ConfigKey::KEY_COUNT).to_string(), "");
}

TEST_F(ConfigTest, LoadedValues)
{
    Config cfg {config_loader_, std::make_unique<PartialFallbackValueProvider>()};
    EXPECT_EQ(cfg.get_string(ConfigKey::RENDEZVOUS_URL), rendezvous_url_);
    EXPECT_EQ(cfg.get_integer(ConfigKey::TRANSIT_ACK_TIMEOUT), ack_timeout_);
    EXPECT_EQ(cfg.get_duration(ConfigKey::TRANSIT_ACK_TIMEOUT), 2500ms);
}

TEST_F(ConfigTest, MissingValueUsesFallback)
{
    Config cfg {config_loader_, std::make_unique<PartialFallbackValueProvider>()};
    EXPECT_EQ(cfg.get_integer(ConfigKey::TRANSFER_CHUNK_SIZE),
        PartialFallbackValueProvider::chunk_size_);
}

TEST_F(ConfigTest, MistypedValueUsesFallback)
{
    Config cfg {config_loader_, std::make_unique<PartialFallbackValueProvider>()};
    EXPECT_EQ(cfg.get_string(ConfigKey::RELAY_URL), PartialFallbackValueProvider::relay_url_);
}

TEST_F(ConfigTest, NoFallbackForMissingValue)
{
    Config cfg {config_loader_};
    EXPECT_DEATH(cfg.get_integer(ConfigKey::TRANSFER_CHUNK_SIZE), "");
}

TEST_F(ConfigTest, MissingFallbackValue)
{
    Config cfg {config_loader_, std::make_unique<PartialFallbackValueProvider>()};
    EXPECT_DEATH(cfg.get_integer(ConfigKey::PEER_ERROR_NOTIFY_TIMEOUT), "");
}

TEST_F(ConfigTest, DefaultValues)
{
    NiceMock<ConfigLoaderMock> empty_loader;
    ON_CALL(empty_loader, load()).WillByDefault(Return(std::map<std::string, std::any> {}));

    Config cfg {empty_loader, std::make_unique<xfer::DefaultConfigValues>()};
    EXPECT_EQ(cfg.get_string(ConfigKey::RENDEZVOUS_URL), "ws://relay.magic-wormhole.io:4000/v1");
    EXPECT_EQ(cfg.get_string(ConfigKey::RELAY_URL), "tcp://transit.magic-wormhole.io:4001");
    EXPECT_EQ(cfg.get_integer(ConfigKey::TRANSFER_CHUNK_SIZE), 4096);
    EXPECT_EQ(cfg.get_duration(ConfigKey::TRANSIT_ACK_TIMEOUT), 60s);
    EXPECT_EQ(cfg.get_duration(ConfigKey::PEER_ERROR_NOTIFY_TIMEOUT), 1s);
}
