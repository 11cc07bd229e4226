#include "bulktransferv1.hpp"

#include <vector>

#include <glog/logging.h>

#include "messagecodec.hpp"
#include "sha256hasherimpl.hpp"

namespace xfer::bulk
{
BulkTransferV1::BulkTransferV1(std::shared_ptr<const protocol::MessageCodec> codec,
    size_t chunk_size, std::chrono::milliseconds ack_timeout)
    : codec_ {std::move(codec)}
    , chunk_size_ {chunk_size == 0 ? 1 : chunk_size}
    , ack_timeout_ {ack_timeout}
{
}

bool BulkTransferV1::send(transit::TransitChannel &channel, std::istream &source, uint64_t size,
    const ProgressHandler &progress_handler, transfer::TransferError &error)
{
    crypto::SHA256HasherImpl hasher;
    std::vector<uint8_t>     buffer(chunk_size_);
    uint64_t                 sent_size = 0;

    if (progress_handler)
    {
        progress_handler(0, size);
    }

    while (source)
    {
        source.read(reinterpret_cast<char *>(buffer.data()), std::streamsize(buffer.size()));
        auto count = size_t(source.gcount());
        if (count == 0)
        {
            break;
        }

        hasher.update(buffer.data(), count);

        transit::TransitChannel::Record record(buffer.cbegin(), buffer.cbegin() + count);
        if (!channel.send_record(std::move(record)).get())
        {
            LOG(ERROR) << "Sending a record over transit failed after " << sent_size << " bytes";
            error = transfer::TransferError::transit("failed to send data record");
            return false;
        }

        sent_size += count;
        if (progress_handler)
        {
            progress_handler(sent_size, size);
        }
    }

    if (source.bad())
    {
        LOG(ERROR) << "Reading the payload failed after " << sent_size << " bytes";
        error = transfer::TransferError::io("failed to read payload");
        return false;
    }

    if (sent_size != size)
    {
        LOG(ERROR) << "Sent " << sent_size << " bytes, but " << size << " were advertised";
        error = transfer::TransferError::file_size(sent_size, size);
        return false;
    }

    LOG(INFO) << "All " << sent_size << " bytes sent, waiting for acknowledgment";
    return receive_ack(channel, crypto::to_hex(hasher.finalize()), error);
}

bool BulkTransferV1::receive_ack(transit::TransitChannel &channel,
    const std::string &expected_sha256, transfer::TransferError &error)
{
    auto ack_future = channel.receive_record();
    if (ack_future.wait_for(ack_timeout_) != std::future_status::ready)
    {
        LOG(ERROR) << "No transit acknowledgment within " << ack_timeout_.count() << " ms";
        error = transfer::TransferError::ack_error();
        return false;
    }

    auto record = ack_future.get();
    if (!record)
    {
        LOG(ERROR) << "Transit closed before the acknowledgment arrived";
        error = transfer::TransferError::transit("connection closed while waiting for ack");
        return false;
    }

    protocol::TransitAck ack;
    if (!codec_->decode(*record, ack, error))
    {
        return false;
    }

    if (ack.ack != protocol::ack_ok)
    {
        LOG(ERROR) << "Peer did not acknowledge the transfer: " << ack.ack;
        error = transfer::TransferError::ack_error();
        return false;
    }

    if (ack.sha256 != expected_sha256)
    {
        LOG(ERROR) << "Checksum mismatch, sent " << expected_sha256 << ", peer received "
                   << ack.sha256;
        error = transfer::TransferError::checksum();
        return false;
    }

    return true;
}

bool BulkTransferV1::receive(transit::TransitChannel &channel, uint64_t size,
    const ProgressHandler &progress_handler, std::ostream &sink, transfer::TransferError &error)
{
    crypto::SHA256HasherImpl hasher;
    uint64_t                 remaining = size;

    if (progress_handler)
    {
        progress_handler(0, size);
    }

    while (remaining != 0)
    {
        auto record = channel.receive_record().get();
        if (!record)
        {
            LOG(ERROR) << "Transit closed with " << remaining << " of " << size
                       << " bytes outstanding";
            error = transfer::TransferError::transit("connection closed during transfer");
            return false;
        }

        if (record->size() > remaining)
        {
            LOG(ERROR) << "Peer sent more than the " << size << " advertised bytes";
            error = transfer::TransferError::file_size(size - remaining + record->size(), size);
            return false;
        }

        sink.write(reinterpret_cast<const char *>(record->data()), std::streamsize(record->size()));
        if (!sink)
        {
            LOG(ERROR) << "Writing the payload failed";
            error = transfer::TransferError::io("failed to write payload");
            return false;
        }

        hasher.update(record->data(), record->size());
        remaining -= record->size();

        if (progress_handler)
        {
            progress_handler(size - remaining, size);
        }
    }

    sink.flush();
    if (!sink)
    {
        LOG(ERROR) << "Flushing the payload failed";
        error = transfer::TransferError::io("failed to flush payload");
        return false;
    }

    protocol::TransitAck ack {protocol::ack_ok, crypto::to_hex(hasher.finalize())};
    if (!channel.send_record(codec_->encode(ack)).get())
    {
        LOG(ERROR) << "Sending the transit acknowledgment failed";
        error = transfer::TransferError::transit("failed to send ack");
        return false;
    }

    LOG(INFO) << "Received " << size << " bytes, sha256 " << ack.sha256;
    return true;
}
}  // namespace xfer::bulk
