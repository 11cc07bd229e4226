#include "filetransferimpl.hpp"

#include <filesystem>
#include <fstream>

#include <glog/logging.h>

#include "bulktransferv1.hpp"
#include "config.hpp"
#include "filereceiver.hpp"
#include "filesender.hpp"
#include "messagecodecimpl.hpp"
#include "peernotifier.hpp"
#include "transitinitializer.hpp"
#include "wormhole.hpp"

namespace xfer
{
FileTransferImpl::FileTransferImpl(
    std::shared_ptr<transit::TransitInitializer> transit_initializer, const config::Config &cfg)
    : transit_initializer_ {std::move(transit_initializer)}
    , codec_ {std::make_shared<protocol::MessageCodecImpl>()}
    , bulk_transfer_v1_ {std::make_shared<bulk::BulkTransferV1>(codec_,
          size_t(cfg.get_integer(config::ConfigKey::TRANSFER_CHUNK_SIZE)),
          cfg.get_duration(config::ConfigKey::TRANSIT_ACK_TIMEOUT))}
    , peer_notifier_ {std::make_shared<transfer::PeerNotifier>(
          codec_, cfg.get_duration(config::ConfigKey::PEER_ERROR_NOTIFY_TIMEOUT))}
    , rendezvous_url_ {cfg.get_string(config::ConfigKey::RENDEZVOUS_URL)}
    , relay_url_ {cfg.get_string(config::ConfigKey::RELAY_URL)}
{
}

AppConfig FileTransferImpl::app_config() const
{
    return AppConfig {protocol::app_id, rendezvous_url_, relay_url_, protocol::current_app_version()};
}

bool FileTransferImpl::send_file_or_folder(std::unique_ptr<wormhole::Wormhole> wormhole,
    const std::string &relay_url, const std::string &path, const std::string &display_name,
    const bulk::ProgressHandler &progress_handler, transfer::TransferError &error)
{
    std::error_code ec;
    if (std::filesystem::is_directory(path, ec))
    {
        return send_folder(std::move(wormhole), relay_url, path, display_name, progress_handler,
            error);
    }

    auto size = std::filesystem::file_size(path, ec);
    if (ec)
    {
        LOG(ERROR) << "Cannot determine size of " << path << ": " << ec.message();
        error = transfer::TransferError::io(path + ": " + ec.message());
        return false;
    }

    std::ifstream fs {path, std::ios::in | std::ios::binary};
    if (!fs)
    {
        LOG(ERROR) << "Cannot open " << path << " for reading";
        error = transfer::TransferError::io("cannot open " + path);
        return false;
    }

    return send_file(std::move(wormhole), relay_url, fs, display_name, size, progress_handler,
        error);
}

bool FileTransferImpl::send_file(std::unique_ptr<wormhole::Wormhole> wormhole,
    const std::string &relay_url, std::istream &reader, const std::string &display_name,
    uint64_t size, const bulk::ProgressHandler &progress_handler, transfer::TransferError &error)
{
    transfer::FileSender sender {
        std::move(wormhole), transit_initializer_, codec_, bulk_transfer_v1_, peer_notifier_};
    return sender.send_file(
        relay_url.empty() ? relay_url_ : relay_url, reader, display_name, size, progress_handler,
        error);
}

bool FileTransferImpl::send_folder(std::unique_ptr<wormhole::Wormhole> wormhole,
    const std::string &relay_url, const std::string &folder_path, const std::string &display_name,
    const bulk::ProgressHandler &progress_handler, transfer::TransferError &error)
{
    transfer::FileSender sender {
        std::move(wormhole), transit_initializer_, codec_, bulk_transfer_v1_, peer_notifier_};
    return sender.send_folder(relay_url.empty() ? relay_url_ : relay_url, folder_path,
        display_name, progress_handler, error);
}

std::unique_ptr<transfer::ReceiveRequest> FileTransferImpl::request_file(
    std::unique_ptr<wormhole::Wormhole> wormhole, const std::string &relay_url,
    transfer::TransferError &error)
{
    transfer::FileReceiver receiver {
        std::move(wormhole), transit_initializer_, codec_, bulk_transfer_v1_, peer_notifier_};
    return receiver.request(relay_url.empty() ? relay_url_ : relay_url, error);
}
}  // namespace xfer
