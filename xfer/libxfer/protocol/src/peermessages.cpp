#include "peermessages.hpp"

namespace xfer::protocol
{
namespace
{
struct MessageNameVisitor
{
    const char *operator()(const OfferMessage &) const
    {
        return "offer";
    }

    const char *operator()(const AnswerMessage &) const
    {
        return "answer";
    }

    const char *operator()(const TransitMessage &) const
    {
        return "transit";
    }

    const char *operator()(const ErrorMessage &) const
    {
        return "error";
    }

    const char *operator()(const UnknownMessage &) const
    {
        return "unknown";
    }
};
}  // namespace

const char *message_name(const PeerMessage &message)
{
    return std::visit(MessageNameVisitor {}, message);
}
}  // namespace xfer::protocol
