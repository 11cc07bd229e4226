#include "messagecodecimpl.hpp"

#include <limits>

#include <glog/logging.h>
#include <nlohmann/json.hpp>

namespace xfer::protocol
{
namespace
{
using nlohmann::json;

constexpr char const *direct_tcp_v1 = "direct-tcp-v1";
constexpr char const *relay_v1      = "relay-v1";

std::string dump(const json &j)
{
    // Invalid UTF-8 coming from local strings gets replaced rather than thrown on
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

json encode_direct_hint(const transit::DirectHint &hint)
{
    return json {{"type", direct_tcp_v1}, {"hostname", hint.hostname}, {"port", hint.port},
        {"priority", hint.priority}};
}

json encode_transit(const TransitMessage &message)
{
    json abilities = json::array();
    if (message.abilities.direct_tcp_v1)
    {
        abilities.push_back({{"type", direct_tcp_v1}});
    }
    if (message.abilities.relay_v1)
    {
        abilities.push_back({{"type", relay_v1}});
    }

    json hints = json::array();
    for (const auto &hint : message.hints.direct_tcp)
    {
        hints.push_back(encode_direct_hint(hint));
    }
    for (const auto &relay : message.hints.relay)
    {
        json relay_hint {{"type", relay_v1}, {"hints", json::array()}};
        if (!relay.name.empty())
        {
            relay_hint["name"] = relay.name;
        }
        for (const auto &hint : relay.tcp)
        {
            relay_hint["hints"].push_back(encode_direct_hint(hint));
        }
        hints.push_back(std::move(relay_hint));
    }

    return json {{"abilities-v1", std::move(abilities)}, {"hints-v1", std::move(hints)}};
}

struct OfferEncoder
{
    json operator()(const FileOffer &offer) const
    {
        return {{"file", {{"filename", offer.filename}, {"filesize", offer.filesize}}}};
    }

    json operator()(const DirectoryOffer &offer) const
    {
        return {{"directory", {{"dirname", offer.dirname}, {"mode", offer.mode},
                                  {"zipsize", offer.zipsize}, {"numbytes", offer.numbytes},
                                  {"numfiles", offer.numfiles}}}};
    }

    json operator()(const TextOffer &offer) const
    {
        return {{"message", offer.message}};
    }

    json operator()(const UnknownOffer &offer) const
    {
        return {{offer.tag, nullptr}};
    }
};

struct MessageEncoder
{
    json operator()(const OfferMessage &message) const
    {
        return {{"offer", std::visit(OfferEncoder {}, message.offer)}};
    }

    json operator()(const AnswerMessage &message) const
    {
        switch (message.kind)
        {
            case AnswerMessage::Kind::FILE_ACK: return {{"answer", {{"file_ack", message.value}}}};
            case AnswerMessage::Kind::MESSAGE_ACK:
                return {{"answer", {{"message_ack", message.value}}}};
            case AnswerMessage::Kind::UNKNOWN:
            default: return {{"answer", {{message.value, nullptr}}}};
        }
    }

    json operator()(const TransitMessage &message) const
    {
        return {{"transit", encode_transit(message)}};
    }

    json operator()(const ErrorMessage &message) const
    {
        return {{"error", message.message}};
    }

    json operator()(const UnknownMessage &message) const
    {
        if (message.tag.empty())
        {
            return json::object();
        }
        return {{message.tag, nullptr}};
    }
};

bool get_string(const json &object, const char *key, std::string &out, std::string &why)
{
    auto it = object.find(key);
    if (it == object.end() || !it->is_string())
    {
        why = std::string {"missing or non-string field '"} + key + "'";
        return false;
    }
    out = it->get<std::string>();
    return true;
}

bool get_unsigned(const json &object, const char *key, uint64_t &out, std::string &why)
{
    auto it = object.find(key);
    if (it == object.end() || !it->is_number_unsigned())
    {
        why = std::string {"missing or non-unsigned field '"} + key + "'";
        return false;
    }
    out = it->get<uint64_t>();
    return true;
}

bool decode_direct_hint(const json &j, transit::DirectHint &hint, std::string &why)
{
    uint64_t port;
    if (!get_string(j, "hostname", hint.hostname, why) || !get_unsigned(j, "port", port, why))
    {
        return false;
    }
    if (port > std::numeric_limits<uint16_t>::max())
    {
        why = "port " + std::to_string(port) + " out of range";
        return false;
    }
    hint.port = uint16_t(port);

    hint.priority = 0.0;
    auto it       = j.find("priority");
    if (it != j.end())
    {
        if (!it->is_number())
        {
            why = "non-numeric hint priority";
            return false;
        }
        hint.priority = it->get<double>();
    }

    return true;
}

bool decode_transit(const json &j, TransitMessage &message, std::string &why)
{
    if (!j.is_object())
    {
        why = "transit must be an object";
        return false;
    }

    auto abilities = j.find("abilities-v1");
    auto hints     = j.find("hints-v1");
    if (abilities == j.end() || !abilities->is_array() || hints == j.end() || !hints->is_array())
    {
        why = "transit requires 'abilities-v1' and 'hints-v1' arrays";
        return false;
    }

    message = TransitMessage {};

    for (const auto &ability : *abilities)
    {
        std::string type;
        if (!ability.is_object() || !get_string(ability, "type", type, why))
        {
            why = "malformed ability: " + why;
            return false;
        }

        if (type == direct_tcp_v1)
        {
            message.abilities.direct_tcp_v1 = true;
        }
        else if (type == relay_v1)
        {
            message.abilities.relay_v1 = true;
        }
        else
        {
            LOG(INFO) << "Ignoring unknown transit ability " << type;
        }
    }

    for (const auto &hint : *hints)
    {
        std::string type;
        if (!hint.is_object() || !get_string(hint, "type", type, why))
        {
            why = "malformed hint: " + why;
            return false;
        }

        if (type == direct_tcp_v1)
        {
            transit::DirectHint direct;
            if (!decode_direct_hint(hint, direct, why))
            {
                return false;
            }
            message.hints.direct_tcp.push_back(std::move(direct));
        }
        else if (type == relay_v1)
        {
            transit::RelayHint relay;

            auto name = hint.find("name");
            if (name != hint.end() && name->is_string())
            {
                relay.name = name->get<std::string>();
            }

            auto relay_hints = hint.find("hints");
            if (relay_hints == hint.end() || !relay_hints->is_array())
            {
                why = "relay hint requires a 'hints' array";
                return false;
            }

            for (const auto &endpoint : *relay_hints)
            {
                if (!endpoint.is_object())
                {
                    why = "malformed relay endpoint";
                    return false;
                }

                auto endpoint_type = endpoint.find("type");
                if (endpoint_type != endpoint.end() && *endpoint_type != direct_tcp_v1)
                {
                    LOG(INFO) << "Ignoring relay endpoint of type " << endpoint_type->dump();
                    continue;
                }

                transit::DirectHint direct;
                if (!decode_direct_hint(endpoint, direct, why))
                {
                    return false;
                }
                relay.tcp.push_back(std::move(direct));
            }

            message.hints.relay.push_back(std::move(relay));
        }
        else
        {
            LOG(INFO) << "Ignoring transit hint of type " << type;
        }
    }

    return true;
}

bool decode_offer(const json &j, OfferMessage &message, std::string &why)
{
    if (!j.is_object() || j.empty())
    {
        why = "offer must be a non-empty object";
        return false;
    }

    if (auto it = j.find("file"); it != j.end())
    {
        FileOffer offer;
        if (!it->is_object() || !get_string(*it, "filename", offer.filename, why) ||
            !get_unsigned(*it, "filesize", offer.filesize, why))
        {
            why = "malformed file offer: " + why;
            return false;
        }
        message.offer = std::move(offer);
        return true;
    }

    if (auto it = j.find("directory"); it != j.end())
    {
        DirectoryOffer offer;
        if (!it->is_object() || !get_string(*it, "dirname", offer.dirname, why) ||
            !get_string(*it, "mode", offer.mode, why) ||
            !get_unsigned(*it, "zipsize", offer.zipsize, why) ||
            !get_unsigned(*it, "numbytes", offer.numbytes, why) ||
            !get_unsigned(*it, "numfiles", offer.numfiles, why))
        {
            why = "malformed directory offer: " + why;
            return false;
        }
        message.offer = std::move(offer);
        return true;
    }

    if (auto it = j.find("message"); it != j.end())
    {
        if (!it->is_string())
        {
            why = "text offer must be a string";
            return false;
        }
        message.offer = TextOffer {it->get<std::string>()};
        return true;
    }

    message.offer = UnknownOffer {j.begin().key()};
    return true;
}

bool decode_answer(const json &j, AnswerMessage &message, std::string &why)
{
    if (!j.is_object() || j.empty())
    {
        why = "answer must be a non-empty object";
        return false;
    }

    if (j.contains("file_ack"))
    {
        message.kind = AnswerMessage::Kind::FILE_ACK;
        return get_string(j, "file_ack", message.value, why);
    }

    if (j.contains("message_ack"))
    {
        message.kind = AnswerMessage::Kind::MESSAGE_ACK;
        return get_string(j, "message_ack", message.value, why);
    }

    message.kind  = AnswerMessage::Kind::UNKNOWN;
    message.value = j.begin().key();
    return true;
}

bool decode_message(const json &root, PeerMessage &message, std::string &why)
{
    if (!root.is_object())
    {
        why = "message must be an object";
        return false;
    }

    if (auto it = root.find("offer"); it != root.end())
    {
        OfferMessage offer;
        if (!decode_offer(*it, offer, why))
        {
            return false;
        }
        message = std::move(offer);
        return true;
    }

    if (auto it = root.find("answer"); it != root.end())
    {
        AnswerMessage answer;
        if (!decode_answer(*it, answer, why))
        {
            return false;
        }
        message = std::move(answer);
        return true;
    }

    if (auto it = root.find("transit"); it != root.end())
    {
        TransitMessage transit;
        if (!decode_transit(*it, transit, why))
        {
            return false;
        }
        message = std::move(transit);
        return true;
    }

    if (auto it = root.find("error"); it != root.end())
    {
        if (!it->is_string())
        {
            why = "error must be a string";
            return false;
        }
        message = ErrorMessage {it->get<std::string>()};
        return true;
    }

    message = UnknownMessage {root.empty() ? std::string {} : root.begin().key()};
    return true;
}
}  // namespace

std::vector<uint8_t> MessageCodecImpl::encode(const PeerMessage &message) const
{
    auto text = dump(std::visit(MessageEncoder {}, message));
    return std::vector<uint8_t>(text.cbegin(), text.cend());
}

bool MessageCodecImpl::decode(const std::vector<uint8_t> &bytes, PeerMessage &message,
    transfer::TransferError &error) const
{
    auto root = json::parse(bytes.cbegin(), bytes.cend(), nullptr, false);
    if (root.is_discarded())
    {
        LOG(WARNING) << "Received a peer message that is not valid JSON";
        error = transfer::TransferError::protocol_decode_text("invalid JSON");
        return false;
    }

    std::string why;
    if (!decode_message(root, message, why))
    {
        LOG(WARNING) << "Malformed peer message: " << why;
        error = transfer::TransferError::protocol_decode_text(why);
        return false;
    }

    if (std::holds_alternative<UnknownMessage>(message))
    {
        LOG(WARNING) << "Received unknown peer message " << dump(root);
    }

    return true;
}

std::vector<uint8_t> MessageCodecImpl::encode(const TransitAck &ack) const
{
    return json::to_msgpack(json {{"ack", ack.ack}, {"sha256", ack.sha256}});
}

bool MessageCodecImpl::decode(
    const std::vector<uint8_t> &bytes, TransitAck &ack, transfer::TransferError &error) const
{
    auto root = json::from_msgpack(bytes, true, false);
    if (root.is_discarded())
    {
        LOG(WARNING) << "Received a transit ack that is not valid msgpack";
        error = transfer::TransferError::protocol_decode_binary("invalid msgpack");
        return false;
    }

    std::string why;
    if (!root.is_object() || !get_string(root, "ack", ack.ack, why) ||
        !get_string(root, "sha256", ack.sha256, why))
    {
        if (why.empty())
        {
            why = "transit ack must be a map";
        }
        LOG(WARNING) << "Malformed transit ack: " << why;
        error = transfer::TransferError::protocol_decode_binary(why);
        return false;
    }

    return true;
}

std::string to_string(const PeerMessage &message)
{
    return dump(std::visit(MessageEncoder {}, message));
}
}  // namespace xfer::protocol
