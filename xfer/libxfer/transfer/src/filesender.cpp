#include "filesender.hpp"

#include <glog/logging.h>

#include "messagecodec.hpp"
#include "peerexchange.hpp"
#include "peernotifier.hpp"
#include "transitinitializer.hpp"
#include "wormhole.hpp"
#include "ziparchive.hpp"

namespace xfer::transfer
{
const char *to_string(FileSender::State state)
{
    switch (state)
    {
        case FileSender::State::START: return "START";
        case FileSender::State::TRANSIT_NEGOTIATED: return "TRANSIT_NEGOTIATED";
        case FileSender::State::OFFER_SENT: return "OFFER_SENT";
        case FileSender::State::ACKED: return "ACKED";
        case FileSender::State::TRANSFERRING: return "TRANSFERRING";
        case FileSender::State::CLOSED: return "CLOSED";
        case FileSender::State::FAILED: return "FAILED";
        default: return "INVALID_STATE";
    }
}

FileSender::FileSender(std::unique_ptr<wormhole::Wormhole> wormhole,
    std::shared_ptr<transit::TransitInitializer>            transit_initializer,
    std::shared_ptr<const protocol::MessageCodec>           codec,
    std::shared_ptr<bulk::BulkTransfer>                     bulk_transfer_v1,
    std::shared_ptr<const PeerNotifier>                     peer_notifier)
    : wormhole_ {std::move(wormhole)}
    , transit_initializer_ {std::move(transit_initializer)}
    , codec_ {std::move(codec)}
    , bulk_transfer_v1_ {std::move(bulk_transfer_v1)}
    , peer_notifier_ {std::move(peer_notifier)}
    , state_ {State::START}
{
}

FileSender::~FileSender() = default;

FileSender::State FileSender::state() const
{
    return state_;
}

bool FileSender::send_file(const std::string &relay_url, std::istream &source,
    const std::string &display_name, uint64_t size, const bulk::ProgressHandler &progress_handler,
    TransferError &error)
{
    LOG(INFO) << "Offering file " << display_name << " (" << size << " bytes)";
    return run(relay_url, protocol::FileOffer {display_name, size}, source, size, progress_handler,
        nullptr, error);
}

bool FileSender::send_folder(const std::string &relay_url, const std::string &folder_path,
    const std::string &display_name, const bulk::ProgressHandler &progress_handler,
    TransferError &error)
{
    storage::ZipArchive archive {folder_path};
    std::string         scan_error;
    if (!archive.scan(scan_error))
    {
        LOG(ERROR) << "Cannot archive folder " << folder_path << ": " << scan_error;
        return fail(TransferError::io(scan_error), error);
    }

    protocol::DirectoryOffer offer {storage::archive_file_name(display_name),
        protocol::directory_mode_zipped, archive.archive_size(), archive.total_file_bytes(),
        archive.file_count()};
    LOG(INFO) << "Offering folder " << folder_path << " as " << offer.dirname << " ("
              << offer.numfiles << " files, " << offer.numbytes << " bytes, " << offer.zipsize
              << " bytes zipped)";

    storage::ZipArchive::Reader reader {archive};
    std::istream                source {&reader};
    return run(relay_url, offer, source, offer.zipsize, progress_handler,
        [&reader] { return reader.skewed(); }, error);
}

bool FileSender::run(const std::string &relay_url, const protocol::OfferVariant &offer,
    std::istream &source, uint64_t size, const bulk::ProgressHandler &progress_handler,
    const std::function<bool()> &source_skewed, TransferError &error)
{
    if (state_ != State::START)
    {
        LOG(ERROR) << "Sender already used, state is " << to_string(state_);
        error = TransferError::protocol("sender already used");
        return false;
    }

    if (!wormhole_)
    {
        LOG(ERROR) << "Sender has no wormhole";
        error = TransferError::protocol("no wormhole");
        return false;
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
    set_state(State::TRANSIT_NEGOTIATED);

    if (!exchange::send_message(*wormhole_, *codec_, protocol::OfferMessage {offer}, step_error))
    {
        return fail(step_error, error);
    }
    set_state(State::OFFER_SENT);

    protocol::PeerMessage reply;
    if (!exchange::receive_message(*wormhole_, *codec_, reply, step_error))
    {
        return fail(step_error, error);
    }

    std::shared_ptr<const transit::Hints> their_hints;
    transit::Abilities                    their_abilities;
    if (auto transit_message = std::get_if<protocol::TransitMessage>(&reply))
    {
        their_abilities = transit_message->abilities;
        their_hints     = std::make_shared<const transit::Hints>(transit_message->hints);
    }
    else if (auto error_message = std::get_if<protocol::ErrorMessage>(&reply))
    {
        return fail(TransferError::peer_error(error_message->message), error);
    }
    else
    {
        return fail(TransferError::unexpected_message("transit", protocol::to_string(reply)), error);
    }

    if (!exchange::receive_message(*wormhole_, *codec_, reply, step_error))
    {
        return fail(step_error, error);
    }

    if (auto answer = std::get_if<protocol::AnswerMessage>(&reply))
    {
        if (answer->kind != protocol::AnswerMessage::Kind::FILE_ACK ||
            answer->value != protocol::ack_ok)
        {
            LOG(ERROR) << "Offer was not acknowledged: " << protocol::to_string(reply);
            return fail(TransferError::ack_error(), error);
        }
    }
    else if (auto error_message = std::get_if<protocol::ErrorMessage>(&reply))
    {
        return fail(TransferError::peer_error(error_message->message), error);
    }
    else
    {
        return fail(TransferError::unexpected_message("answer", protocol::to_string(reply)), error);
    }
    set_state(State::ACKED);

    auto channel = connector
                       ->leader_connect(wormhole_->derive_transit_key(wormhole_->app_id()),
                           their_abilities, their_hints)
                       .get();
    if (!channel)
    {
        LOG(ERROR) << "Could not establish a transit connection";
        return fail(TransferError::transit_connect("no transit connection to the peer"), error);
    }
    set_state(State::TRANSFERRING);

    if (!bulk_transfer_v1_->send(*channel, source, size, progress_handler, step_error))
    {
        if (source_skewed && source_skewed())
        {
            step_error = TransferError::filesystem_skew();
        }
        return fail(step_error, error);
    }

    if (!wormhole_->close().get())
    {
        LOG(ERROR) << "Closing the wormhole failed";
        return fail(TransferError::channel("failed to close the wormhole"), error);
    }
    set_state(State::CLOSED);

    LOG(INFO) << "Transfer of " << size << " bytes completed";
    return true;
}

bool FileSender::fail(TransferError reason, TransferError &error)
{
    LOG(ERROR) << "Sending failed in state " << to_string(state_) << ": " << reason.describe();
    set_state(State::FAILED);
    if (wormhole_)
    {
        peer_notifier_->notify(*wormhole_, reason);
    }
    error = std::move(reason);
    return false;
}

void FileSender::set_state(State state)
{
    LOG(INFO) << "Sender state " << to_string(state_) << " -> " << to_string(state);
    state_ = state;
}
}  // namespace xfer::transfer
