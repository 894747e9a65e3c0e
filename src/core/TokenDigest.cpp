#include "TokenDigest.hpp"

#include <algorithm>
#include <memory>
#include <stdexcept>

#include <openssl/evp.h>
#include <openssl/err.h>
#include <fmt/format.h>

std::string NTokenDigest::digest(const std::string& credential) {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx)
        throw std::runtime_error("EVP_MD_CTX_new failed");

    if (!EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr))
        throw std::runtime_error(fmt::format("EVP_DigestInit_ex: {}", ERR_error_string(ERR_get_error(), nullptr)));

    if (!EVP_DigestUpdate(ctx.get(), credential.data(), credential.size()))
        throw std::runtime_error(fmt::format("EVP_DigestUpdate: {}", ERR_error_string(ERR_get_error(), nullptr)));

    unsigned char buf[EVP_MAX_MD_SIZE];
    unsigned int  len = 0;

    if (!EVP_DigestFinal_ex(ctx.get(), buf, &len))
        throw std::runtime_error(fmt::format("EVP_DigestFinal_ex: {}", ERR_error_string(ERR_get_error(), nullptr)));

    std::string hex;
    hex.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        hex += fmt::format("{:02x}", buf[i]);
    }

    return hex;
}

bool NTokenDigest::isDigest(const std::string& str) {
    return str.size() == TOKEN_DIGEST_LENGTH && std::all_of(str.begin(), str.end(), [](const char& c) { return (c >= 'a' && c <= 'f') || (c >= '0' && c <= '9'); });
}
