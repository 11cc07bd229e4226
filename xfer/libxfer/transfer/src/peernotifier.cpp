#include "peernotifier.hpp"

#include <glog/logging.h>

#include "messagecodec.hpp"
#include "wormhole.hpp"

namespace xfer::transfer
{
PeerNotifier::PeerNotifier(
    std::shared_ptr<const protocol::MessageCodec> codec, std::chrono::milliseconds notify_timeout)
    : codec_ {std::move(codec)}
    , notify_timeout_ {notify_timeout}
{
}

void PeerNotifier::notify(wormhole::Wormhole &wormhole, const TransferError &error) const
{
    if (error.kind() == TransferError::Kind::PEER_ERROR || !error.is_error())
    {
        return;
    }

    auto text = error.to_string();
    auto sent = wormhole.send(codec_->encode(protocol::ErrorMessage {text}));
    if (sent.wait_for(notify_timeout_) != std::future_status::ready)
    {
        LOG(WARNING) << "Peer was not notified of the failure within " << notify_timeout_.count()
                     << " ms, giving up";
        return;
    }

    if (!sent.get())
    {
        LOG(WARNING) << "Could not notify peer of the failure: " << text;
        return;
    }

    LOG(INFO) << "Notified peer of the failure: " << text;
}
}  // namespace xfer::transfer
