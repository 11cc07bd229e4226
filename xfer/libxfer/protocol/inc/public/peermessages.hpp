#ifndef XFER_PROTOCOL_PEERMESSAGES_HPP_
#define XFER_PROTOCOL_PEERMESSAGES_HPP_

#include <cstdint>
#include <string>
#include <variant>

#include "abilities.hpp"
#include "hints.hpp"

namespace xfer::protocol
{
using FileSize = uint64_t;

struct FileOffer
{
    std::string filename;
    FileSize    filesize {};

    bool operator==(const FileOffer &rhs) const
    {
        return filename == rhs.filename && filesize == rhs.filesize;
    }
};

struct DirectoryOffer
{
    std::string dirname;
    std::string mode;
    FileSize    zipsize {};
    FileSize    numbytes {};
    uint64_t    numfiles {};

    bool operator==(const DirectoryOffer &rhs) const
    {
        return dirname == rhs.dirname && mode == rhs.mode && zipsize == rhs.zipsize &&
               numbytes == rhs.numbytes && numfiles == rhs.numfiles;
    }
};

struct TextOffer
{
    std::string message;

    bool operator==(const TextOffer &rhs) const
    {
        return message == rhs.message;
    }
};

// An offer kind this implementation does not know about
struct UnknownOffer
{
    std::string tag;

    bool operator==(const UnknownOffer &rhs) const
    {
        return tag == rhs.tag;
    }
};

using OfferVariant = std::variant<FileOffer, DirectoryOffer, TextOffer, UnknownOffer>;

struct OfferMessage
{
    OfferVariant offer;

    bool operator==(const OfferMessage &rhs) const
    {
        return offer == rhs.offer;
    }
};

struct AnswerMessage
{
    enum class Kind
    {
        FILE_ACK,
        MESSAGE_ACK,
        UNKNOWN
    };

    Kind        kind {Kind::FILE_ACK};
    std::string value;

    static AnswerMessage file_ack(std::string value)
    {
        return AnswerMessage {Kind::FILE_ACK, std::move(value)};
    }

    bool operator==(const AnswerMessage &rhs) const
    {
        return kind == rhs.kind && value == rhs.value;
    }
};

struct TransitMessage
{
    transit::Abilities abilities;
    transit::Hints     hints;

    bool operator==(const TransitMessage &rhs) const
    {
        return abilities == rhs.abilities && hints == rhs.hints;
    }
};

struct ErrorMessage
{
    std::string message;

    bool operator==(const ErrorMessage &rhs) const
    {
        return message == rhs.message;
    }
};

// A message whose top level tag is not recognized
struct UnknownMessage
{
    std::string tag;

    bool operator==(const UnknownMessage &rhs) const
    {
        return tag == rhs.tag;
    }
};

using PeerMessage =
    std::variant<OfferMessage, AnswerMessage, TransitMessage, ErrorMessage, UnknownMessage>;

// Sent by the bulk transfer receiver over transit once all bytes arrived
struct TransitAck
{
    std::string ack;
    std::string sha256;

    bool operator==(const TransitAck &rhs) const
    {
        return ack == rhs.ack && sha256 == rhs.sha256;
    }
};

constexpr char const *directory_mode_zipped = "zipped";
constexpr char const *ack_ok                = "ok";

// Short name of the message kind ("offer", "transit", ...)
const char *message_name(const PeerMessage &message);
}  // namespace xfer::protocol

#endif  // XFER_PROTOCOL_PEERMESSAGES_HPP_
