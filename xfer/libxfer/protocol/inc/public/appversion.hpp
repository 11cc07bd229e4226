#ifndef XFER_PROTOCOL_APPVERSION_HPP_
#define XFER_PROTOCOL_APPVERSION_HPP_

#include <nlohmann/json.hpp>

#include "transfererror.hpp"

namespace xfer::protocol
{
// Identifies this protocol on the rendezvous server. Must not be changed for interop.
constexpr char const *app_id = "lothar.com/wormhole/text-or-file-xfer";

enum class ProtocolGeneration
{
    V1,
    V2
};

/**
 * Application specific version information, exchanged during the wormhole handshake.
 *
 * There are no recognized options yet. The record is reserved for the supported ability
 * tags and for the transfer-v2 hint (archive formats, transit abilities). Peers advertising
 * those must still be understood, so decoding ignores unknown fields.
 */
struct AppVersion
{
    [[nodiscard]] bool supports_v2() const
    {
        return false;
    }

    bool operator==(const AppVersion & /*rhs*/) const
    {
        return true;
    }
};

AppVersion current_app_version();

nlohmann::json encode_app_version(const AppVersion &version);

bool decode_peer_app_version(
    const nlohmann::json &raw, AppVersion &version, transfer::TransferError &error);

ProtocolGeneration select_protocol_generation(const AppVersion &ours, const AppVersion &theirs);

const char *to_string(ProtocolGeneration generation);
}  // namespace xfer::protocol

#endif  // XFER_PROTOCOL_APPVERSION_HPP_
