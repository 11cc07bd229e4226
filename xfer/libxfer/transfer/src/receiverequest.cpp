#include "receiverequest.hpp"

#include <glog/logging.h>

#include "messagecodec.hpp"
#include "peerexchange.hpp"
#include "peernotifier.hpp"
#include "transitconnector.hpp"
#include "wormhole.hpp"

namespace xfer::transfer
{
namespace
{
constexpr char const *reject_message = "transfer rejected";
}  // namespace

ReceiveRequest::ReceiveRequest(std::unique_ptr<wormhole::Wormhole> wormhole,
    std::unique_ptr<transit::TransitConnector> connector, transit::Abilities their_abilities,
    std::shared_ptr<const transit::Hints> their_hints, std::string filename, uint64_t filesize,
    std::shared_ptr<const protocol::MessageCodec> codec,
    std::shared_ptr<bulk::BulkTransfer>           bulk_transfer_v1,
    std::shared_ptr<const PeerNotifier>           peer_notifier)
    : wormhole_ {std::move(wormhole)}
    , connector_ {std::move(connector)}
    , their_abilities_ {their_abilities}
    , their_hints_ {std::move(their_hints)}
    , filename_ {std::move(filename)}
    , filesize_ {filesize}
    , codec_ {std::move(codec)}
    , bulk_transfer_v1_ {std::move(bulk_transfer_v1)}
    , peer_notifier_ {std::move(peer_notifier)}
    , state_ {FileReceiver::State::OFFER_PENDING}
{
}

ReceiveRequest::~ReceiveRequest()
{
    if (state_ == FileReceiver::State::OFFER_PENDING)
    {
        LOG(WARNING) << "Offer of " << filename_ << " dropped without accepting or rejecting it";
    }
}

const std::string &ReceiveRequest::filename() const
{
    return filename_;
}

uint64_t ReceiveRequest::filesize() const
{
    return filesize_;
}

FileReceiver::State ReceiveRequest::state() const
{
    return state_;
}

bool ReceiveRequest::accept(std::unique_ptr<ReceiveRequest> request,
    const bulk::ProgressHandler &progress_handler, std::ostream &sink, TransferError &error)
{
    if (!request)
    {
        LOG(ERROR) << "Cannot accept a missing receive request";
        error = TransferError::protocol("no pending offer");
        return false;
    }
    return request->accept_impl(progress_handler, sink, error);
}

bool ReceiveRequest::reject(std::unique_ptr<ReceiveRequest> request, TransferError &error)
{
    if (!request)
    {
        LOG(ERROR) << "Cannot reject a missing receive request";
        error = TransferError::protocol("no pending offer");
        return false;
    }
    return request->reject_impl(error);
}

bool ReceiveRequest::accept_impl(
    const bulk::ProgressHandler &progress_handler, std::ostream &sink, TransferError &error)
{
    set_state(FileReceiver::State::ACCEPTED);

    TransferError step_error;
    if (!exchange::send_message(*wormhole_, *codec_,
            protocol::AnswerMessage::file_ack(protocol::ack_ok), step_error))
    {
        return fail(step_error, error);
    }

    auto channel = connector_
                       ->follower_connect(wormhole_->derive_transit_key(wormhole_->app_id()),
                           their_abilities_, their_hints_)
                       .get();
    if (!channel)
    {
        LOG(ERROR) << "Could not establish a transit connection";
        return fail(TransferError::transit_connect("no transit connection to the peer"), error);
    }

    if (!bulk_transfer_v1_->receive(*channel, filesize_, progress_handler, sink, step_error))
    {
        return fail(step_error, error);
    }

    if (!wormhole_->close().get())
    {
        LOG(ERROR) << "Closing the wormhole failed";
        return fail(TransferError::channel("failed to close the wormhole"), error);
    }
    set_state(FileReceiver::State::CLOSED);

    LOG(INFO) << "Received " << filename_ << " (" << filesize_ << " bytes)";
    return true;
}

bool ReceiveRequest::reject_impl(TransferError &error)
{
    set_state(FileReceiver::State::REJECTED);

    TransferError step_error;
    if (!exchange::send_message(
            *wormhole_, *codec_, protocol::ErrorMessage {reject_message}, step_error))
    {
        set_state(FileReceiver::State::FAILED);
        error = step_error;
        return false;
    }

    if (!wormhole_->close().get())
    {
        LOG(ERROR) << "Closing the wormhole failed";
        set_state(FileReceiver::State::FAILED);
        error = TransferError::channel("failed to close the wormhole");
        return false;
    }
    set_state(FileReceiver::State::CLOSED);

    LOG(INFO) << "Rejected " << filename_;
    return true;
}

bool ReceiveRequest::fail(TransferError reason, TransferError &error)
{
    LOG(ERROR) << "Receiving " << filename_ << " failed: " << reason.describe();
    set_state(FileReceiver::State::FAILED);
    peer_notifier_->notify(*wormhole_, reason);
    error = std::move(reason);
    return false;
}

void ReceiveRequest::set_state(FileReceiver::State state)
{
    LOG(INFO) << "Receive request state " << to_string(state_) << " -> " << to_string(state);
    state_ = state;
}
}  // namespace xfer::transfer
