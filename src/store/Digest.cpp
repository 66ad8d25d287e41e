#include "fris/store/Digest.hpp"
#include "fris/core/Errors.hpp"

#include <openssl/evp.h>

#include <iomanip>
#include <memory>
#include <sstream>

namespace fris {
namespace Digest {

Sha256 sha256(const std::string& payload) {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx) {
        throw FrisError("EVP_MD_CTX_new failed");
    }

    Sha256 digest{};
    unsigned int digest_len = 0;
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), payload.data(), payload.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest.data(), &digest_len) != 1 ||
        digest_len != digest.size()) {
        throw FrisError("SHA-256 digest failed");
    }
    return digest;
}

std::string sha256Hex(const std::string& payload) {
    const Sha256 digest = sha256(payload);
    std::ostringstream out;
    for (unsigned char b : digest)
        out << std::hex << std::setw(2) << std::setfill('0')
            << static_cast<int>(b);
    return out.str();
}

uint64_t sha256Prefix64(const std::string& payload) {
    const Sha256 digest = sha256(payload);
    uint64_t v = 0;
    for (size_t i = 0; i < 8; ++i) {
        v = (v << 8) | digest[i];
    }
    return v;
}

} // namespace Digest
} // namespace fris
