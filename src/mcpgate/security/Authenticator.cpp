//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/mcpgate/security/Authenticator.cpp
// Purpose: Token verification using OpenSSL digest and constant-time compare
//==========================================================================================================

#include <stdexcept>

#include <openssl/crypto.h>
#include <openssl/evp.h>

#include "mcpgate/security/Authenticator.hpp"

namespace mcpgate::security {

Authenticator::Authenticator(std::optional<std::string> secret) {
    if (secret.has_value() && !secret->empty()) {
        secretDigest = digestOf(secret.value());
    }
}

Authenticator::Digest Authenticator::digestOf(const std::string& data) {
    Digest out{};
    unsigned int len = 0;
    if (::EVP_Digest(data.data(), data.size(), out.data(), &len, ::EVP_sha256(), nullptr) != 1 ||
        len != out.size()) {
        throw std::runtime_error("EVP_Digest(SHA-256) failed");
    }
    return out;
}

bool Authenticator::VerifyToken(const std::string& token) const {
    if (!secretDigest.has_value()) {
        return true;
    }
    const Digest presented = digestOf(token);
    return ::CRYPTO_memcmp(presented.data(), secretDigest->data(), presented.size()) == 0;
}

bool Authenticator::Verify(const std::string& token, std::string& errorMessage) const {
    if (VerifyToken(token)) {
        return true;
    }
    errorMessage = "Invalid authentication token";
    return false;
}

} // namespace mcpgate::security
