//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Authenticator.hpp
// Purpose: Shared-secret token verification with a timing-safe comparison
//==========================================================================================================

#pragma once

#include <array>
#include <optional>
#include <string>

namespace mcpgate::security {

//==========================================================================================================
// ITokenVerifier
// Purpose: Validates a client-presented credential.
// Returns: true when the token is accepted; errorMessage is set on rejection.
//==========================================================================================================
class ITokenVerifier {
public:
    virtual ~ITokenVerifier() = default;
    virtual bool Verify(const std::string& token, std::string& errorMessage) const = 0;
};

//==========================================================================================================
// Authenticator
// Purpose: Verifies tokens against one configured secret.
// Notes:
//   - With no secret configured every token (including none) is accepted.
//   - Tokens are compared as SHA-256 digests with CRYPTO_memcmp, so the time taken depends neither on
//     the length of the presented token nor on how long a prefix of it matches.
//==========================================================================================================
class Authenticator : public ITokenVerifier {
public:
    explicit Authenticator(std::optional<std::string> secret = std::nullopt);

    bool Enabled() const { return secretDigest.has_value(); }

    bool VerifyToken(const std::string& token) const;

    bool Verify(const std::string& token, std::string& errorMessage) const override;

private:
    using Digest = std::array<unsigned char, 32>;
    static Digest digestOf(const std::string& data);

    std::optional<Digest> secretDigest;
};

} // namespace mcpgate::security
