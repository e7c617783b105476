#include "Digest.hpp"

#include <memory>

#include <openssl/evp.h>

#include "../errors/CacheErrors.hpp"

namespace {

using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

} // namespace

std::string Digest::sha256Hex(const std::string& data) {
    EvpMdCtxPtr ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx) {
        throw CacheError("Failed to create message digest context");
    }
    if (!EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr)) {
        throw CacheError("Failed to initialize SHA-256 digest");
    }
    if (!EVP_DigestUpdate(ctx.get(), data.data(), data.size())) {
        throw CacheError("Failed to update SHA-256 digest with " + std::to_string(data.size()) + " bytes");
    }
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (!EVP_DigestFinal_ex(ctx.get(), hash, &length)) {
        throw CacheError("Failed to finalize SHA-256 digest");
    }

    static constexpr char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(length * 2);
    for (unsigned int i = 0; i < length; ++i) {
        out.push_back(digits[hash[i] >> 4]);
        out.push_back(digits[hash[i] & 0x0F]);
    }
    return out;
}
