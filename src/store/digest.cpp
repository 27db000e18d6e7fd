/**
 * @file digest.cpp
 * @brief SHA-256 through OpenSSL's EVP interface.
 * @author Dimitris Kafetzis
 */

#include "store/digest.hpp"

#include <memory>
#include <openssl/evp.h>

namespace proc_sandbox {

namespace {

using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

}  // anonymous namespace

Result<Digest> compute_digest(std::string_view bytes) {
    EvpMdCtxPtr ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx) {
        return Error{"Failed to create message digest context"};
    }
    if (!EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr)) {
        return Error{"Failed to initialize SHA-256 digest"};
    }
    if (!EVP_DigestUpdate(ctx.get(), bytes.data(), bytes.size())) {
        return Error{"Failed to update digest with " + std::to_string(bytes.size()) + " bytes"};
    }

    unsigned char raw[EVP_MAX_MD_SIZE];
    unsigned int raw_len = 0;
    if (!EVP_DigestFinal_ex(ctx.get(), raw, &raw_len)) {
        return Error{"Failed to finalize SHA-256 digest"};
    }

    return Digest{
        .hash = to_hex(std::string_view(reinterpret_cast<const char*>(raw), raw_len)),
        .size_bytes = static_cast<uint64_t>(bytes.size())
    };
}

std::string to_hex(std::string_view raw) {
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string out;
    out.reserve(raw.size() * 2);
    for (unsigned char c : raw) {
        out += kDigits[c >> 4];
        out += kDigits[c & 0x0F];
    }
    return out;
}

bool is_valid_hash(std::string_view hash) noexcept {
    if (hash.size() != 64) return false;
    for (char c : hash) {
        bool digit = c >= '0' && c <= '9';
        bool lower = c >= 'a' && c <= 'f';
        if (!digit && !lower) return false;
    }
    return true;
}

}  // namespace proc_sandbox
