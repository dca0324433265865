//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SecurityGate.hpp
// Purpose: Connection admission, per-request rate limiting and token authentication
//==========================================================================================================

#pragma once

#include <memory>
#include <optional>
#include <string>

#include "mcpgate/security/Authenticator.hpp"
#include "mcpgate/security/IPFilter.hpp"
#include "mcpgate/security/RateLimiter.hpp"

namespace mcpgate {
struct ServerConfig;
}

namespace mcpgate::security {

//==========================================================================================================
// AdmissionResult
// Purpose: Outcome of a gate check; reason is empty when allowed.
//==========================================================================================================
struct AdmissionResult {
    bool allowed{true};
    std::string reason;

    static AdmissionResult Allow() { return AdmissionResult{}; }
    static AdmissionResult Deny(std::string why) { return AdmissionResult{false, std::move(why)}; }
};

//==========================================================================================================
// SecurityGate
// Purpose: Composes IPFilter, RateLimiter and an ITokenVerifier into the checks run by a connection.
// Notes:
//   - The gate holds no state of its own; the composed services carry their own locks.
//   - authRequired=false turns Authenticate into an unconditional allow.
//==========================================================================================================
class SecurityGate {
public:
    SecurityGate(std::shared_ptr<IPFilter> ipFilter,
                 std::shared_ptr<RateLimiter> rateLimiter,
                 std::shared_ptr<ITokenVerifier> verifier,
                 bool authRequired);

    // Builds the filter, limiter and Authenticator described by the config.
    static std::shared_ptr<SecurityGate> FromConfig(const ServerConfig& config);

    //==========================================================================================================
    // Runs before any byte is read from a new connection.
    // Returns:
    //   Deny("IP address blocked due to failed attempts") or Deny("IP address not allowed") on refusal.
    //==========================================================================================================
    AdmissionResult CheckConnection(const std::string& ip);

    // Consumes one request from ip's rate-limit window; Deny("Rate limit exceeded") when exhausted.
    AdmissionResult CheckRateLimit(const std::string& ip);

    //==========================================================================================================
    // Verifies the presented token. Both refusals count a failed attempt against ip.
    // Returns:
    //   Deny("Authentication token required") when token is absent or empty,
    //   Deny(<verifier reason>) when the verifier rejects it.
    //==========================================================================================================
    AdmissionResult Authenticate(const std::string& ip, const std::optional<std::string>& token);

    bool AuthRequired() const { return authRequired; }

    IPFilter& Filter() { return *ipFilter; }
    RateLimiter& Limiter() { return *rateLimiter; }

private:
    std::shared_ptr<IPFilter> ipFilter;
    std::shared_ptr<RateLimiter> rateLimiter;
    std::shared_ptr<ITokenVerifier> verifier;
    bool authRequired;
};

} // namespace mcpgate::security
