#ifndef XFER_API_FILETRANSFER_HPP_
#define XFER_API_FILETRANSFER_HPP_

#include <cstdint>
#include <istream>
#include <memory>
#include <ostream>
#include <string>

#include "appconfig.hpp"
#include "bulktransfer.hpp"
#include "receiverequest.hpp"
#include "transfererror.hpp"
#include "xferapidefs.h"

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

namespace xfer
{
// Forward declarations
class FileTransferImpl;

using transfer::ReceiveRequest;
using transfer::TransferError;

/**
 * Entry points of the file transfer protocol.
 *
 * Every call takes over an established wormhole and consumes it. Calls block until the
 * transfer finished or failed, return false on failure and describe the failure in error.
 * An empty relay_url selects the relay from the configuration.
 */
class XFER_API FileTransfer
{
public:
    // A missing or unreadable configuration file leaves every setting at its default
    FileTransfer(std::shared_ptr<transit::TransitInitializer> transit_initializer,
        const std::string                                    &config_file_path);
    FileTransfer(FileTransfer &&other) noexcept;
    FileTransfer &operator=(FileTransfer &&rhs) noexcept;
    ~FileTransfer();

    [[nodiscard]] AppConfig app_config() const;

    bool send_file_or_folder(std::unique_ptr<wormhole::Wormhole> wormhole,
        const std::string &relay_url, const std::string &path, const std::string &display_name,
        const bulk::ProgressHandler &progress_handler, TransferError &error);

    bool send_file(std::unique_ptr<wormhole::Wormhole> wormhole, const std::string &relay_url,
        std::istream &reader, const std::string &display_name, uint64_t size,
        const bulk::ProgressHandler &progress_handler, TransferError &error);

    bool send_folder(std::unique_ptr<wormhole::Wormhole> wormhole, const std::string &relay_url,
        const std::string &folder_path, const std::string &display_name,
        const bulk::ProgressHandler &progress_handler, TransferError &error);

    // Waits for the peer's offer. Consume the result with ReceiveRequest::accept or reject.
    std::unique_ptr<ReceiveRequest> request_file(std::unique_ptr<wormhole::Wormhole> wormhole,
        const std::string &relay_url, TransferError &error);

private:
    std::unique_ptr<FileTransferImpl> impl_;
};
}  // namespace xfer

#endif  // XFER_API_FILETRANSFER_HPP_
