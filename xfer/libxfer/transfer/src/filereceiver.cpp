#include "filereceiver.hpp"

#include <glog/logging.h>

#include "messagecodec.hpp"
#include "peerexchange.hpp"
#include "peernotifier.hpp"
#include "receiverequest.hpp"
#include "transitinitializer.hpp"
#include "wormhole.hpp"
#include "ziparchive.hpp"

namespace xfer::transfer
{
const char *to_string(FileReceiver::State state)
{
    switch (state)
    {
        case FileReceiver::State::START: return "START";
        case FileReceiver::State::TRANSIT_NEGOTIATED: return "TRANSIT_NEGOTIATED";
        case FileReceiver::State::OFFER_PENDING: return "OFFER_PENDING";
        case FileReceiver::State::ACCEPTED: return "ACCEPTED";
        case FileReceiver::State::REJECTED: return "REJECTED";
        case FileReceiver::State::CLOSED: return "CLOSED";
        case FileReceiver::State::FAILED: return "FAILED";
        default: return "INVALID_STATE";
    }
}

FileReceiver::FileReceiver(std::unique_ptr<wormhole::Wormhole> wormhole,
    std::shared_ptr<transit::TransitInitializer>                transit_initializer,
    std::shared_ptr<const protocol::MessageCodec>               codec,
    std::shared_ptr<bulk::BulkTransfer>                         bulk_transfer_v1,
    std::shared_ptr<const PeerNotifier>                         peer_notifier)
    : wormhole_ {std::move(wormhole)}
    , transit_initializer_ {std::move(transit_initializer)}
    , codec_ {std::move(codec)}
    , bulk_transfer_v1_ {std::move(bulk_transfer_v1)}
    , peer_notifier_ {std::move(peer_notifier)}
    , state_ {State::START}
{
}

FileReceiver::~FileReceiver() = default;

FileReceiver::State FileReceiver::state() const
{
    return state_;
}

std::unique_ptr<ReceiveRequest> FileReceiver::request(
    const std::string &relay_url, TransferError &error)
{
    if (state_ != State::START || !wormhole_)
    {
        LOG(ERROR) << "Receiver already used, state is " << to_string(state_);
        error = TransferError::protocol("receiver already used");
        return nullptr;
    }

    TransferError                step_error;
    protocol::ProtocolGeneration generation {};
    if (!exchange::negotiate_generation(*wormhole_, generation, step_error))
    {
        return fail(step_error, error);
    }

    std::unique_ptr<transit::TransitConnector> connector;
    if (!exchange::open_transit(*transit_initializer_, relay_url, connector, step_error))
    {
        return fail(step_error, error);
    }

    protocol::TransitMessage our_transit {connector->our_abilities(), {}};
    if (auto our_hints = connector->our_hints())
    {
        our_transit.hints = *our_hints;
    }
    if (!exchange::send_message(*wormhole_, *codec_, our_transit, step_error))
    {
        return fail(step_error, error);
    }

    protocol::PeerMessage message;
    if (!exchange::receive_message(*wormhole_, *codec_, message, step_error))
    {
        return fail(step_error, error);
    }

    std::shared_ptr<const transit::Hints> their_hints;
    transit::Abilities                    their_abilities;
    if (auto transit_message = std::get_if<protocol::TransitMessage>(&message))
    {
        their_abilities = transit_message->abilities;
        their_hints     = std::make_shared<const transit::Hints>(transit_message->hints);
    }
    else if (auto error_message = std::get_if<protocol::ErrorMessage>(&message))
    {
        return fail(TransferError::peer_error(error_message->message), error);
    }
    else
    {
        return fail(
            TransferError::unexpected_message("transit", protocol::to_string(message)), error);
    }
    set_state(State::TRANSIT_NEGOTIATED);

    if (!exchange::receive_message(*wormhole_, *codec_, message, step_error))
    {
        return fail(step_error, error);
    }

    std::string filename;
    uint64_t    filesize = 0;
    if (auto offer_message = std::get_if<protocol::OfferMessage>(&message))
    {
        if (auto file = std::get_if<protocol::FileOffer>(&offer_message->offer))
        {
            filename = file->filename;
            filesize = file->filesize;
        }
        else if (auto directory = std::get_if<protocol::DirectoryOffer>(&offer_message->offer))
        {
            // Every archive mode arrives as a single zip file
            filename = storage::archive_file_name(directory->dirname);
            filesize = directory->zipsize;
        }
        else
        {
            LOG(WARNING) << "Unsupported offer " << protocol::to_string(message);
            return fail(TransferError::unsupported_offer(), error);
        }
    }
    else if (auto error_message = std::get_if<protocol::ErrorMessage>(&message))
    {
        return fail(TransferError::peer_error(error_message->message), error);
    }
    else
    {
        return fail(
            TransferError::unexpected_message("offer", protocol::to_string(message)), error);
    }
    set_state(State::OFFER_PENDING);

    LOG(INFO) << "Peer offers " << filename << " (" << filesize << " bytes)";
    return std::make_unique<ReceiveRequest>(std::move(wormhole_), std::move(connector),
        their_abilities, std::move(their_hints), std::move(filename), filesize, codec_,
        bulk_transfer_v1_, peer_notifier_);
}

std::unique_ptr<ReceiveRequest> FileReceiver::fail(TransferError reason, TransferError &error)
{
    LOG(ERROR) << "Receiving failed in state " << to_string(state_) << ": " << reason.describe();
    set_state(State::FAILED);
    peer_notifier_->notify(*wormhole_, reason);
    error = std::move(reason);
    return nullptr;
}

void FileReceiver::set_state(State state)
{
    LOG(INFO) << "Receiver state " << to_string(state_) << " -> " << to_string(state);
    state_ = state;
}
}  // namespace xfer::transfer
