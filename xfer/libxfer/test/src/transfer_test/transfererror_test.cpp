#include <gtest/gtest.h>

#include <sstream>

#include "transfererror.hpp"

using namespace ::testing;
using namespace ::xfer::transfer;

TEST(TransferErrorTest, DefaultIsNoError)
{
    TransferError error;
    EXPECT_EQ(error.kind(), TransferError::Kind::NONE);
    EXPECT_FALSE(error.is_error());
    EXPECT_FALSE(error);
}

TEST(TransferErrorTest, FileSize)
{
    auto error = TransferError::file_size(4, 5);
    EXPECT_TRUE(error);
    EXPECT_EQ(error.kind(), TransferError::Kind::FILE_SIZE);
    EXPECT_EQ(error.sent_size(), 4);
    EXPECT_EQ(error.expected_size(), 5);
    EXPECT_EQ(error.to_string(),
        "The file contained a different amount of bytes than advertized! Sent 4 bytes, but "
        "should have been 5");
}

TEST(TransferErrorTest, PeerError)
{
    auto error = TransferError::peer_error("transfer rejected");
    EXPECT_EQ(error.message(), "transfer rejected");
    EXPECT_EQ(error.to_string(), "Something went wrong on the other side: transfer rejected");
    EXPECT_EQ(error.describe(), error.to_string());
}

TEST(TransferErrorTest, UnexpectedMessage)
{
    auto error = TransferError::unexpected_message("transit", R"({"error":"x"})");
    EXPECT_EQ(error.expected_message(), "transit");
    EXPECT_EQ(error.received_message(), R"({"error":"x"})");
    EXPECT_EQ(error.to_string(),
        R"(Unexpected message (protocol error): Expected 'transit', but got: {"error":"x"})");
}

TEST(TransferErrorTest, DetailOnlyInDescription)
{
    auto error = TransferError::protocol_decode_text("invalid JSON");
    EXPECT_EQ(error.to_string(), "Corrupt JSON message received");
    EXPECT_EQ(error.describe(), "Corrupt JSON message received: invalid JSON");

    EXPECT_EQ(TransferError::checksum().describe(), "Receive checksum error");
}

TEST(TransferErrorTest, Equality)
{
    EXPECT_EQ(TransferError::file_size(4, 5), TransferError::file_size(4, 5));
    EXPECT_NE(TransferError::file_size(4, 5), TransferError::file_size(5, 4));
    EXPECT_NE(TransferError::transit("a"), TransferError::transit_connect("a"));
    EXPECT_EQ(TransferError::ack_error(), TransferError::ack_error());
}

TEST(TransferErrorTest, StreamOutput)
{
    std::ostringstream ss;
    ss << TransferError::io("disk full");
    EXPECT_EQ(ss.str(), "IO (IO error: disk full)");
}
