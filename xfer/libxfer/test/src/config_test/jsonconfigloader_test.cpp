#include <gtest/gtest.h>

#include <fstream>
#include <string>

#include "jsonconfigloader.hpp"
#include "testutils.hpp"

using namespace ::testing;
using namespace ::xfer::config;

namespace
{
class JSONConfigLoaderTest : public Test
{
protected:
    std::string write_config(const std::string &name, const std::string &contents)
    {
        auto          path = tmp_.path() / name;
        std::ofstream out {path};
        out << contents;
        return path.string();
    }

    testutils::TemporaryDirectory tmp_;
};
}  // namespace

TEST_F(JSONConfigLoaderTest, BasicJSON)
{
    JSONConfigLoader ldr {write_config("basic.json", R"({
        "rendezvous_url": "ws://localhost:4000/v1",
        "transfer_chunk_size": 65536,
        "offset": -10,
        "ratio": 1.55,
        "verbose": true
    })")};
    auto vals = ldr.load();

    EXPECT_EQ(vals.size(), 5);
    EXPECT_EQ(std::any_cast<std::string>(vals.at("rendezvous_url")), "ws://localhost:4000/v1");
    EXPECT_EQ(std::any_cast<long long>(vals.at("transfer_chunk_size")), 65536);
    EXPECT_EQ(std::any_cast<long long>(vals.at("offset")), -10);
    EXPECT_EQ(std::any_cast<double>(vals.at("ratio")), 1.55);
    EXPECT_EQ(std::any_cast<bool>(vals.at("verbose")), true);
}

TEST_F(JSONConfigLoaderTest, SectionsAreFlattened)
{
    JSONConfigLoader ldr {write_config("sections.json", R"({
        "servers": {"rendezvous_url": "ws://a:1/v1", "relay_url": "tcp://b:2"},
        "timeouts": {"transit_ack_timeout": 100, "nested": {"peer_error_notify_timeout": 5}},
        "ignored": [1, 2, 3]
    })")};
    auto vals = ldr.load();

    EXPECT_EQ(vals.size(), 4);
    EXPECT_EQ(std::any_cast<std::string>(vals.at("relay_url")), "tcp://b:2");
    EXPECT_EQ(std::any_cast<long long>(vals.at("transit_ack_timeout")), 100);
    EXPECT_EQ(std::any_cast<long long>(vals.at("peer_error_notify_timeout")), 5);
}

TEST_F(JSONConfigLoaderTest, MissingFile)
{
    JSONConfigLoader ldr {(tmp_.path() / "missing.json").string()};
    EXPECT_TRUE(ldr.load().empty());
}

TEST_F(JSONConfigLoaderTest, MalformedFile)
{
    JSONConfigLoader ldr {write_config("bad.json", "{\"relay_url\": ")};
    EXPECT_TRUE(ldr.load().empty());

    JSONConfigLoader array_ldr {write_config("array.json", "[1, 2]")};
    EXPECT_TRUE(array_ldr.load().empty());
}
