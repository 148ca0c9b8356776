/// @file src/identity/digest.cpp
/// @brief OpenSSL EVP SHA-256 wrapper.

#include "digest.hpp"

#include <openssl/evp.h>

#include <memory>
#include <stdexcept>

namespace mvault::identity {

namespace {

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const noexcept { EVP_MD_CTX_free(ctx); }
};

using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

} // anonymous namespace

Digest sha256(std::initializer_list<std::span<const std::uint8_t>> parts) {
    Digest out{};

    MdCtxPtr ctx{EVP_MD_CTX_new()};
    if (!ctx) {
        throw std::runtime_error("OpenSSL: EVP_MD_CTX_new failed");
    }
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("OpenSSL: EVP_DigestInit_ex failed");
    }
    for (const auto& part : parts) {
        if (EVP_DigestUpdate(ctx.get(), part.data(), part.size()) != 1) {
            throw std::runtime_error("OpenSSL: EVP_DigestUpdate failed");
        }
    }

    unsigned int out_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), out.data(), &out_len) != 1) {
        throw std::runtime_error("OpenSSL: EVP_DigestFinal_ex failed");
    }
    if (out_len != out.size()) {
        throw std::runtime_error("OpenSSL: unexpected SHA-256 digest length");
    }
    return out;
}

} // namespace mvault::identity
