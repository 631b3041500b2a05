// © 2026 Beatrix Zselezny. All rights reserved.
// Gossamer Membership Framework

#include "membership/Hash.hpp"

#include <openssl/evp.h>

#include <memory>

namespace Gossamer::Membership {

    namespace {
        struct DigestContextDeleter {
            void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
        };
        using DigestContext = std::unique_ptr<EVP_MD_CTX, DigestContextDeleter>;
    }

    std::string Hash::toHex() const {
        static const char digits[] = "0123456789abcdef";
        std::string out;
        out.reserve(SIZE * 2);
        for (uint8_t b : bytes) {
            out.push_back(digits[b >> 4]);
            out.push_back(digits[b & 0x0f]);
        }
        return out;
    }

    Hash computeHash(const std::string& data) {
        DigestContext ctx(EVP_MD_CTX_new());
        if (!ctx) {
            throw HashError("EVP_MD_CTX_new failed");
        }

        if (EVP_DigestInit_ex(ctx.get(), EVP_sha3_256(), nullptr) != 1) {
            throw HashError("EVP_DigestInit_ex(sha3-256) failed");
        }
        if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
            throw HashError("EVP_DigestUpdate failed");
        }

        Hash result;
        unsigned int len = 0;
        if (EVP_DigestFinal_ex(ctx.get(), result.bytes.data(), &len) != 1) {
            throw HashError("EVP_DigestFinal_ex failed");
        }
        if (len != Hash::SIZE) {
            throw HashError("unexpected digest length " + std::to_string(len));
        }
        return result;
    }

} // namespace Gossamer::Membership
