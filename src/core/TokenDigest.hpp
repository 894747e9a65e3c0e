#pragma once

#include <string>

constexpr const size_t TOKEN_DIGEST_LENGTH = 64;

namespace NTokenDigest {
    // lowercase hex sha256 of the credential bytes, throws std::runtime_error if openssl fails
    std::string digest(const std::string& credential);

    bool        isDigest(const std::string& str);
};
