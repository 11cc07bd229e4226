#ifndef XFER_TEST_FAKENET_FAKEWORMHOLE_HPP_
#define XFER_TEST_FAKENET_FAKEWORMHOLE_HPP_

#include <memory>
#include <utility>

#include "duplex.hpp"
#include "wormhole.hpp"

// One side of an in-memory wormhole. Both sides of a pair share the transit key.
class FakeWormhole : public xfer::wormhole::Wormhole
{
public:
    using Mailbox = Duplex<Bytes>;

    static std::pair<std::unique_ptr<FakeWormhole>, std::unique_ptr<FakeWormhole>> make_pair(
        nlohmann::json peer_version = nlohmann::json::object());

    FakeWormhole(std::shared_ptr<Mailbox> mailbox, Mailbox::End end,
        xfer::transit::TransitKey transit_key, nlohmann::json peer_version);
    ~FakeWormhole() override;

    std::future<bool>                 send(Bytes message) override;
    std::future<std::optional<Bytes>> receive() override;
    std::future<bool>                 close() override;

    [[nodiscard]] std::string               app_id() const override;
    [[nodiscard]] xfer::transit::TransitKey derive_transit_key(
        const std::string &app_id) const override;
    [[nodiscard]] nlohmann::json            peer_version() const override;

    [[nodiscard]] std::shared_ptr<Mailbox> mailbox() const;
    [[nodiscard]] Mailbox::End             end() const;

private:
    const std::shared_ptr<Mailbox>  mailbox_;
    const Mailbox::End              end_;
    const xfer::transit::TransitKey transit_key_;
    const nlohmann::json            peer_version_;
};

#endif  // XFER_TEST_FAKENET_FAKEWORMHOLE_HPP_
