#include "filetransfer.hpp"

#include "config.hpp"
#include "defaultconfigvalues.hpp"
#include "filetransferimpl.hpp"
#include "jsonconfigloader.hpp"
#include "transitinitializer.hpp"
#include "wormhole.hpp"

namespace xfer
{
FileTransfer::FileTransfer(std::shared_ptr<transit::TransitInitializer> transit_initializer,
    const std::string                                                 &config_file_path)
    : impl_ {std::make_unique<FileTransferImpl>(std::move(transit_initializer),
          config::Config {config::JSONConfigLoader {config_file_path},
              std::make_unique<DefaultConfigValues>()})}
{}

FileTransfer::FileTransfer(FileTransfer &&other) noexcept
    : impl_ {std::move(other.impl_)}
{}

FileTransfer &FileTransfer::operator=(FileTransfer &&rhs) noexcept
{
    impl_ = std::move(rhs.impl_);
    return *this;
}

FileTransfer::~FileTransfer() = default;

AppConfig FileTransfer::app_config() const
{
    return impl_->app_config();
}

bool FileTransfer::send_file_or_folder(std::unique_ptr<wormhole::Wormhole> wormhole,
    const std::string &relay_url, const std::string &path, const std::string &display_name,
    const bulk::ProgressHandler &progress_handler, TransferError &error)
{
    return impl_->send_file_or_folder(
        std::move(wormhole), relay_url, path, display_name, progress_handler, error);
}

bool FileTransfer::send_file(std::unique_ptr<wormhole::Wormhole> wormhole,
    const std::string &relay_url, std::istream &reader, const std::string &display_name,
    uint64_t size, const bulk::ProgressHandler &progress_handler, TransferError &error)
{
    return impl_->send_file(
        std::move(wormhole), relay_url, reader, display_name, size, progress_handler, error);
}

bool FileTransfer::send_folder(std::unique_ptr<wormhole::Wormhole> wormhole,
    const std::string &relay_url, const std::string &folder_path, const std::string &display_name,
    const bulk::ProgressHandler &progress_handler, TransferError &error)
{
    return impl_->send_folder(
        std::move(wormhole), relay_url, folder_path, display_name, progress_handler, error);
}

std::unique_ptr<ReceiveRequest> FileTransfer::request_file(
    std::unique_ptr<wormhole::Wormhole> wormhole, const std::string &relay_url,
    TransferError &error)
{
    return impl_->request_file(std::move(wormhole), relay_url, error);
}
}  // namespace xfer
