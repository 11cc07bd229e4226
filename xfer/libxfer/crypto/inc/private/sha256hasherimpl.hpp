#ifndef XFER_CRYPTO_SHA256HASHERIMPL_HPP_
#define XFER_CRYPTO_SHA256HASHERIMPL_HPP_

#include <memory>

#include <openssl/evp.h>

#include "sha256hasher.hpp"

namespace xfer::crypto
{
class SHA256HasherImpl : public SHA256Hasher
{
public:
    SHA256HasherImpl();
    SHA256HasherImpl(const SHA256HasherImpl &) = delete;
    SHA256HasherImpl &operator=(const SHA256HasherImpl &) = delete;

    void              update(const Byte *data, size_t len) override;
    std::vector<Byte> finalize() override;

private:
    struct ContextDeleter
    {
        void operator()(EVP_MD_CTX *ctx) const
        {
            EVP_MD_CTX_free(ctx);
        }
    };

    std::unique_ptr<EVP_MD_CTX, ContextDeleter> ctx_;
    bool                                        finalized_;
};
}  // namespace xfer::crypto

#endif  // XFER_CRYPTO_SHA256HASHERIMPL_HPP_
