#ifndef XFER_API_FILETRANSFERIMPL_HPP_
#define XFER_API_FILETRANSFERIMPL_HPP_

#include <cstdint>
#include <istream>
#include <memory>
#include <string>

#include "appconfig.hpp"
#include "bulktransfer.hpp"
#include "receiverequest.hpp"
#include "transfererror.hpp"

namespace xfer::config
{
// Forward declarations
class Config;
}  // namespace xfer::config

namespace xfer::wormhole
{
// Forward declarations
class Wormhole;
}  // namespace xfer::wormhole

namespace xfer::transit
{
// Forward declarations
class TransitInitializer;
}  // namespace xfer::transit

namespace xfer::protocol
{
// Forward declarations
class MessageCodec;
}  // namespace xfer::protocol

namespace xfer::transfer
{
// Forward declarations
class PeerNotifier;
}  // namespace xfer::transfer

namespace xfer
{
class FileTransferImpl
{
public:
    FileTransferImpl(
        std::shared_ptr<transit::TransitInitializer> transit_initializer, const config::Config &cfg);

    [[nodiscard]] AppConfig app_config() const;

    bool send_file_or_folder(std::unique_ptr<wormhole::Wormhole> wormhole,
        const std::string &relay_url, const std::string &path, const std::string &display_name,
        const bulk::ProgressHandler &progress_handler, transfer::TransferError &error);
    bool send_file(std::unique_ptr<wormhole::Wormhole> wormhole, const std::string &relay_url,
        std::istream &reader, const std::string &display_name, uint64_t size,
        const bulk::ProgressHandler &progress_handler, transfer::TransferError &error);
    bool send_folder(std::unique_ptr<wormhole::Wormhole> wormhole, const std::string &relay_url,
        const std::string &folder_path, const std::string &display_name,
        const bulk::ProgressHandler &progress_handler, transfer::TransferError &error);
    std::unique_ptr<transfer::ReceiveRequest> request_file(
        std::unique_ptr<wormhole::Wormhole> wormhole, const std::string &relay_url,
        transfer::TransferError &error);

private:
    const std::shared_ptr<transit::TransitInitializer>  transit_initializer_;
    const std::shared_ptr<const protocol::MessageCodec> codec_;
    const std::shared_ptr<bulk::BulkTransfer>           bulk_transfer_v1_;
    const std::shared_ptr<const transfer::PeerNotifier> peer_notifier_;
    const std::string                                   rendezvous_url_;
    const std::string                                   relay_url_;
};
}  // namespace xfer

#endif  // XFER_API_FILETRANSFERIMPL_HPP_
