#include "fakewormhole.hpp"

#include <atomic>

#include "appversion.hpp"

std::pair<std::unique_ptr<FakeWormhole>, std::unique_ptr<FakeWormhole>> FakeWormhole::make_pair(
    nlohmann::json peer_version)
{
    static std::atomic_uint8_t pair_count {0};

    auto                      mailbox = std::make_shared<Mailbox>();
    xfer::transit::TransitKey key {};
    key.fill(++pair_count);

    return {std::make_unique<FakeWormhole>(mailbox, 0, key, peer_version),
        std::make_unique<FakeWormhole>(mailbox, 1, key, peer_version)};
}

FakeWormhole::FakeWormhole(std::shared_ptr<Mailbox> mailbox, Mailbox::End end,
    xfer::transit::TransitKey transit_key, nlohmann::json peer_version)
    : mailbox_ {std::move(mailbox)}
    , end_ {end}
    , transit_key_ {transit_key}
    , peer_version_ {std::move(peer_version)}
{}

FakeWormhole::~FakeWormhole()
{
    mailbox_->close(end_);
}

std::future<bool> FakeWormhole::send(Bytes message)
{
    return mailbox_->send(end_, std::move(message));
}

std::future<std::optional<FakeWormhole::Bytes>> FakeWormhole::receive()
{
    return mailbox_->receive(end_);
}

std::future<bool> FakeWormhole::close()
{
    mailbox_->close(end_);
    std::promise<bool> promise;
    promise.set_value(true);
    return promise.get_future();
}

std::string FakeWormhole::app_id() const
{
    return xfer::protocol::app_id;
}

xfer::transit::TransitKey FakeWormhole::derive_transit_key(const std::string & /*app_id*/) const
{
    return transit_key_;
}

nlohmann::json FakeWormhole::peer_version() const
{
    return peer_version_;
}

std::shared_ptr<FakeWormhole::Mailbox> FakeWormhole::mailbox() const
{
    return mailbox_;
}

FakeWormhole::Mailbox::End FakeWormhole::end() const
{
    return end_;
}
