#ifndef XFER_CRYPTO_SHA256HASHER_HPP_
#define XFER_CRYPTO_SHA256HASHER_HPP_

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace xfer::crypto
{
// Incremental SHA-256. A hasher is single use: finalize() ends it.
class SHA256Hasher
{
public:
    using Byte = uint8_t;

    virtual ~SHA256Hasher() = default;

    virtual void              update(const Byte *data, size_t len) = 0;
    virtual std::vector<Byte> finalize()                           = 0;
};

std::string to_hex(const std::vector<uint8_t> &bytes);
}  // namespace xfer::crypto

#endif  // XFER_CRYPTO_SHA256HASHER_HPP_
