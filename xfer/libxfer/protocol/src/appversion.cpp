#include "appversion.hpp"

#include <glog/logging.h>

namespace xfer::protocol
{
AppVersion current_app_version()
{
    return AppVersion {};
}

nlohmann::json encode_app_version(const AppVersion & /*version*/)
{
    return nlohmann::json::object();
}

bool decode_peer_app_version(
    const nlohmann::json &raw, AppVersion &version, transfer::TransferError &error)
{
    if (!raw.is_object())
    {
        LOG(WARNING) << "Peer app version is not an object: " << raw.dump();
        error = transfer::TransferError::protocol_decode_text(
            "app version must be an object, got " + std::string {raw.type_name()});
        return false;
    }

    for (const auto &[key, value] : raw.items())
    {
        LOG(INFO) << "Ignoring app version field " << key << " = " << value.dump();
    }

    version = AppVersion {};
    return true;
}

ProtocolGeneration select_protocol_generation(const AppVersion &ours, const AppVersion &theirs)
{
    if (ours.supports_v2() && theirs.supports_v2())
    {
        return ProtocolGeneration::V2;
    }
    return ProtocolGeneration::V1;
}

const char *to_string(ProtocolGeneration generation)
{
    switch (generation)
    {
        case ProtocolGeneration::V1: return "transfer-v1";
        case ProtocolGeneration::V2: return "transfer-v2";
        default: return "INVALID_GENERATION";
    }
}
}  // namespace xfer::protocol
