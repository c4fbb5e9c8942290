#include "carvenet/fingerprint.h"

#include <cstring>
#include <memory>

#include <openssl/evp.h>

namespace carvenet {
namespace {

    struct MdCtxDeleter final {
        void operator()(EVP_MD_CTX* ctx) const noexcept { EVP_MD_CTX_free(ctx); }
    };

    using UniqueMdCtx = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

    static int hex_value(char c) noexcept
    {
        if (c >= '0' && c <= '9') {
            return c - '0';
        }
        if (c >= 'a' && c <= 'f') {
            return c - 'a' + 10;
        }
        if (c >= 'A' && c <= 'F') {
            return c - 'A' + 10;
        }
        return -1;
    }

}  // namespace

size_t
FingerprintHash::operator()(const Fingerprint& fp) const noexcept
{
    // The digest is uniformly distributed; its prefix is a good hash.
    size_t h = 0;
    std::memcpy(&h, fp.bytes.data(), sizeof(h));
    return h;
}


bool
compute_fingerprint(std::span<const std::byte> payload,
                    Fingerprint* out) noexcept
{
    if (!out) {
        return false;
    }
    UniqueMdCtx ctx(EVP_MD_CTX_new());
    if (!ctx) {
        return false;
    }
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        return false;
    }
    if (!payload.empty()
        && EVP_DigestUpdate(ctx.get(), payload.data(), payload.size()) != 1) {
        return false;
    }
    unsigned int len = 0;
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest {};
    if (EVP_DigestFinal_ex(ctx.get(), digest.data(), &len) != 1
        || len != kFingerprintBytes) {
        return false;
    }
    std::memcpy(out->bytes.data(), digest.data(), kFingerprintBytes);
    return true;
}


std::string
fingerprint_hex(const Fingerprint& fp)
{
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(kFingerprintBytes * 2U);
    for (uint8_t b : fp.bytes) {
        out.push_back(kHex[(b >> 4) & 0x0FU]);
        out.push_back(kHex[b & 0x0FU]);
    }
    return out;
}


bool
parse_fingerprint_hex(std::string_view text, Fingerprint* out) noexcept
{
    if (!out || text.size() != kFingerprintBytes * 2U) {
        return false;
    }
    Fingerprint fp;
    for (size_t i = 0; i < kFingerprintBytes; ++i) {
        const int hi = hex_value(text[2U * i + 0U]);
        const int lo = hex_value(text[2U * i + 1U]);
        if (hi < 0 || lo < 0) {
            return false;
        }
        fp.bytes[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    *out = fp;
    return true;
}

}  // namespace carvenet
