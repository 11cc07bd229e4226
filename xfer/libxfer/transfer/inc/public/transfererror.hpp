#ifndef XFER_TRANSFER_TRANSFERERROR_HPP_
#define XFER_TRANSFER_TRANSFERERROR_HPP_

#include <cstdint>
#include <ostream>
#include <string>

namespace xfer::transfer
{
class TransferError
{
public:
    enum class Kind
    {
        NONE,
        ACK_ERROR,
        CHECKSUM,
        FILE_SIZE,
        FILESYSTEM_SKEW,
        UNSUPPORTED_OFFER,
        PEER_ERROR,
        PROTOCOL_DECODE_TEXT,
        PROTOCOL_DECODE_BINARY,
        PROTOCOL,
        PROTOCOL_UNEXPECTED_MESSAGE,
        CHANNEL,
        TRANSIT_CONNECT,
        TRANSIT,
        IO
    };

    TransferError() = default;

    static TransferError ack_error();
    static TransferError checksum();
    static TransferError file_size(uint64_t sent_size, uint64_t file_size);
    static TransferError filesystem_skew();
    static TransferError unsupported_offer();
    static TransferError peer_error(std::string message);
    static TransferError protocol_decode_text(std::string detail);
    static TransferError protocol_decode_binary(std::string detail);
    static TransferError protocol(std::string message);
    static TransferError unexpected_message(std::string expected, std::string got);
    static TransferError channel(std::string detail);
    static TransferError transit_connect(std::string detail);
    static TransferError transit(std::string detail);
    static TransferError io(std::string detail);

    [[nodiscard]] Kind kind() const
    {
        return kind_;
    }

    [[nodiscard]] bool is_error() const
    {
        return kind_ != Kind::NONE;
    }

    explicit operator bool() const
    {
        return is_error();
    }

    // Peer text for PEER_ERROR, message for PROTOCOL, underlying cause for the other kinds
    [[nodiscard]] const std::string &message() const
    {
        return message_;
    }

    [[nodiscard]] const std::string &expected_message() const
    {
        return expected_;
    }

    [[nodiscard]] const std::string &received_message() const
    {
        return got_;
    }

    [[nodiscard]] uint64_t sent_size() const
    {
        return sent_size_;
    }

    [[nodiscard]] uint64_t expected_size() const
    {
        return file_size_;
    }

    // Human readable rendering, also the text sent to the peer in error notifications
    [[nodiscard]] std::string to_string() const;

    // to_string() followed by the underlying cause, if any. Meant for logs.
    [[nodiscard]] std::string describe() const;

    bool operator==(const TransferError &rhs) const;
    bool operator!=(const TransferError &rhs) const
    {
        return !(*this == rhs);
    }

private:
    explicit TransferError(Kind kind, std::string message = {})
        : kind_ {kind}
        , message_ {std::move(message)}
    {
    }

    Kind        kind_ {Kind::NONE};
    std::string message_;
    std::string expected_;
    std::string got_;
    uint64_t    sent_size_ {};
    uint64_t    file_size_ {};
};

const char *to_string(TransferError::Kind kind);

std::ostream &operator<<(std::ostream &os, const TransferError &error);
}  // namespace xfer::transfer

#endif  // XFER_TRANSFER_TRANSFERERROR_HPP_
