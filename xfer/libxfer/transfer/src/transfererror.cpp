#include "transfererror.hpp"

#include <sstream>

namespace xfer::transfer
{
TransferError TransferError::ack_error()
{
    return TransferError {Kind::ACK_ERROR};
}

TransferError TransferError::checksum()
{
    return TransferError {Kind::CHECKSUM};
}

TransferError TransferError::file_size(uint64_t sent_size, uint64_t file_size)
{
    TransferError error {Kind::FILE_SIZE};
    error.sent_size_ = sent_size;
    error.file_size_ = file_size;
    return error;
}

TransferError TransferError::filesystem_skew()
{
    return TransferError {Kind::FILESYSTEM_SKEW};
}

TransferError TransferError::unsupported_offer()
{
    return TransferError {Kind::UNSUPPORTED_OFFER};
}

TransferError TransferError::peer_error(std::string message)
{
    return TransferError {Kind::PEER_ERROR, std::move(message)};
}

TransferError TransferError::protocol_decode_text(std::string detail)
{
    return TransferError {Kind::PROTOCOL_DECODE_TEXT, std::move(detail)};
}

TransferError TransferError::protocol_decode_binary(std::string detail)
{
    return TransferError {Kind::PROTOCOL_DECODE_BINARY, std::move(detail)};
}

TransferError TransferError::protocol(std::string message)
{
    return TransferError {Kind::PROTOCOL, std::move(message)};
}

TransferError TransferError::unexpected_message(std::string expected, std::string got)
{
    TransferError error {Kind::PROTOCOL_UNEXPECTED_MESSAGE};
    error.expected_ = std::move(expected);
    error.got_      = std::move(got);
    return error;
}

TransferError TransferError::channel(std::string detail)
{
    return TransferError {Kind::CHANNEL, std::move(detail)};
}

TransferError TransferError::transit_connect(std::string detail)
{
    return TransferError {Kind::TRANSIT_CONNECT, std::move(detail)};
}

TransferError TransferError::transit(std::string detail)
{
    return TransferError {Kind::TRANSIT, std::move(detail)};
}

TransferError TransferError::io(std::string detail)
{
    return TransferError {Kind::IO, std::move(detail)};
}

std::string TransferError::to_string() const
{
    std::ostringstream ss;

    switch (kind_)
    {
        case Kind::NONE: ss << "No error"; break;
        case Kind::ACK_ERROR: ss << "Transfer was not acknowledged by peer"; break;
        case Kind::CHECKSUM: ss << "Receive checksum error"; break;
        case Kind::FILE_SIZE:
            ss << "The file contained a different amount of bytes than advertized! Sent "
               << sent_size_ << " bytes, but should have been " << file_size_;
            break;
        case Kind::FILESYSTEM_SKEW:
            ss << "The file(s) to send got modified during the transfer, and thus corrupted";
            break;
        case Kind::UNSUPPORTED_OFFER: ss << "Unsupported offer type"; break;
        case Kind::PEER_ERROR: ss << "Something went wrong on the other side: " << message_; break;
        case Kind::PROTOCOL_DECODE_TEXT: ss << "Corrupt JSON message received"; break;
        case Kind::PROTOCOL_DECODE_BINARY: ss << "Corrupt Msgpack message received"; break;
        case Kind::PROTOCOL: ss << "Protocol error: " << message_; break;
        case Kind::PROTOCOL_UNEXPECTED_MESSAGE:
            ss << "Unexpected message (protocol error): Expected '" << expected_
               << "', but got: " << got_;
            break;
        case Kind::CHANNEL: ss << "Wormhole connection error"; break;
        case Kind::TRANSIT_CONNECT: ss << "Error while establishing transit connection"; break;
        case Kind::TRANSIT: ss << "Transit error"; break;
        case Kind::IO: ss << "IO error"; break;
    }

    return ss.str();
}

std::string TransferError::describe() const
{
    switch (kind_)
    {
        case Kind::PEER_ERROR:
        case Kind::PROTOCOL:
        case Kind::PROTOCOL_UNEXPECTED_MESSAGE: return to_string();
        default: break;
    }

    if (message_.empty())
    {
        return to_string();
    }
    return to_string() + ": " + message_;
}

bool TransferError::operator==(const TransferError &rhs) const
{
    return kind_ == rhs.kind_ && message_ == rhs.message_ && expected_ == rhs.expected_ &&
           got_ == rhs.got_ && sent_size_ == rhs.sent_size_ && file_size_ == rhs.file_size_;
}

const char *to_string(TransferError::Kind kind)
{
    switch (kind)
    {
        case TransferError::Kind::NONE: return "NONE";
        case TransferError::Kind::ACK_ERROR: return "ACK_ERROR";
        case TransferError::Kind::CHECKSUM: return "CHECKSUM";
        case TransferError::Kind::FILE_SIZE: return "FILE_SIZE";
        case TransferError::Kind::FILESYSTEM_SKEW: return "FILESYSTEM_SKEW";
        case TransferError::Kind::UNSUPPORTED_OFFER: return "UNSUPPORTED_OFFER";
        case TransferError::Kind::PEER_ERROR: return "PEER_ERROR";
        case TransferError::Kind::PROTOCOL_DECODE_TEXT: return "PROTOCOL_DECODE_TEXT";
        case TransferError::Kind::PROTOCOL_DECODE_BINARY: return "PROTOCOL_DECODE_BINARY";
        case TransferError::Kind::PROTOCOL: return "PROTOCOL";
        case TransferError::Kind::PROTOCOL_UNEXPECTED_MESSAGE: return "PROTOCOL_UNEXPECTED_MESSAGE";
        case TransferError::Kind::CHANNEL: return "CHANNEL";
        case TransferError::Kind::TRANSIT_CONNECT: return "TRANSIT_CONNECT";
        case TransferError::Kind::TRANSIT: return "TRANSIT";
        case TransferError::Kind::IO: return "IO";
        default: return "INVALID_KIND";
    }
}

std::ostream &operator<<(std::ostream &os, const TransferError &error)
{
    return os << to_string(error.kind()) << " (" << error.describe() << ")";
}
}  // namespace xfer::transfer
