/**
 * MAILRLM - Resumable Email Analysis Toolkit
 * Cache Key Implementation - SHA-256 via OpenSSL EVP
 */

#include "cache/cache_key.hpp"

#include <openssl/evp.h>

#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace mailrlm::cache {

namespace {

using EvpContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

} // namespace

CacheKey key_for(std::string_view prompt, std::string_view context, std::string_view model) {
    EvpContext ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx) {
        throw std::runtime_error("Cannot allocate digest context");
    }

    bool ok = EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) == 1
           && EVP_DigestUpdate(ctx.get(), prompt.data(), prompt.size()) == 1
           && EVP_DigestUpdate(ctx.get(), "|", 1) == 1
           && EVP_DigestUpdate(ctx.get(), context.data(), context.size()) == 1
           && EVP_DigestUpdate(ctx.get(), "|", 1) == 1
           && EVP_DigestUpdate(ctx.get(), model.data(), model.size()) == 1;

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (!ok || EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) != 1) {
        throw std::runtime_error("SHA-256 digest failed");
    }

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < digest_len; ++i) {
        oss << std::setw(2) << static_cast<unsigned int>(digest[i]);
    }

    return CacheKey{oss.str()};
}

bool is_valid_key(std::string_view text) {
    if (text.size() != 64) {
        return false;
    }
    for (char c : text) {
        bool hex = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
        if (!hex) return false;
    }
    return true;
}

} // namespace mailrlm::cache
