#include "sha256hasherimpl.hpp"

#include <iomanip>
#include <sstream>

#include <glog/logging.h>
#include <openssl/sha.h>

namespace xfer::crypto
{
SHA256HasherImpl::SHA256HasherImpl()
    : ctx_ {EVP_MD_CTX_new()}
    , finalized_ {false}
{
    if (!ctx_)
    {
        LOG(FATAL) << "EVP_MD_CTX_new failed";
    }

    if (!EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr))
    {
        LOG(FATAL) << "EVP_DigestInit_ex failed";
    }
}

void SHA256HasherImpl::update(const Byte *data, size_t len)
{
    if (finalized_)
    {
        LOG(ERROR) << "SHA-256 hasher already finalized";
        return;
    }

    if (len != 0 && !EVP_DigestUpdate(ctx_.get(), data, len))
    {
        LOG(FATAL) << "EVP_DigestUpdate failed";
    }
}

std::vector<SHA256Hasher::Byte> SHA256HasherImpl::finalize()
{
    if (finalized_)
    {
        LOG(ERROR) << "SHA-256 hasher already finalized";
        return {};
    }
    finalized_ = true;

    std::vector<Byte> digest(SHA256_DIGEST_LENGTH);
    if (!EVP_DigestFinal_ex(ctx_.get(), digest.data(), nullptr))
    {
        LOG(FATAL) << "EVP_DigestFinal_ex failed";
    }

    return digest;
}

std::string to_hex(const std::vector<uint8_t> &bytes)
{
    std::ostringstream ss;
    ss << std::hex;
    for (uint8_t byte : bytes)
    {
        ss << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
    }
    return ss.str();
}
}  // namespace xfer::crypto
