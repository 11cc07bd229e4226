#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>

#include "messagecodecimpl.hpp"
#include "peernotifier.hpp"
#include "testutils.hpp"

#include "wormhole_mock.hpp"

using namespace ::testing;
using namespace ::xfer::protocol;
using namespace ::xfer::transfer;
using namespace ::std::chrono_literals;

namespace
{
class PeerNotifierTest : public Test
{
protected:
    std::shared_ptr<MessageCodecImpl> codec_ = std::make_shared<MessageCodecImpl>();
    PeerNotifier                      notifier_ {codec_, 50ms};
    StrictMock<WormholeMock>          wormhole_;
};
}  // namespace

TEST_F(PeerNotifierTest, SendsRenderedError)
{
    auto error = TransferError::file_size(4, 5);

    EXPECT_CALL(wormhole_, send(codec_->encode(ErrorMessage {error.to_string()})))
        .WillOnce([](auto &&) { return testutils::make_ready_future(true); });

    notifier_.notify(wormhole_, error);
}

TEST_F(PeerNotifierTest, PeerErrorIsNotEchoed)
{
    EXPECT_CALL(wormhole_, send(_)).Times(0);

    notifier_.notify(wormhole_, TransferError::peer_error("disk full"));
    notifier_.notify(wormhole_, TransferError {});
}

TEST_F(PeerNotifierTest, SendFailureIsIgnored)
{
    EXPECT_CALL(wormhole_, send(_)).WillOnce([](auto &&) {
        return testutils::make_ready_future(false);
    });

    notifier_.notify(wormhole_, TransferError::checksum());
}

TEST_F(PeerNotifierTest, StalledSendTimesOut)
{
    std::promise<bool> never_sent;
    EXPECT_CALL(wormhole_, send(_)).WillOnce([&never_sent](auto &&) {
        return never_sent.get_future();
    });

    auto start = std::chrono::steady_clock::now();
    notifier_.notify(wormhole_, TransferError::ack_error());
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_GE(elapsed, 50ms);
    EXPECT_LT(elapsed, 5s);
}
