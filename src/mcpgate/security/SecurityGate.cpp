//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/mcpgate/security/SecurityGate.cpp
// Purpose: SecurityGate implementation
//==========================================================================================================

#include <stdexcept>

#include "logging/Logger.h"
#include "mcpgate/ServerConfig.h"
#include "mcpgate/security/SecurityGate.hpp"

namespace mcpgate::security {

SecurityGate::SecurityGate(std::shared_ptr<IPFilter> filter,
                           std::shared_ptr<RateLimiter> limiter,
                           std::shared_ptr<ITokenVerifier> tokenVerifier,
                           bool requireAuth)
    : ipFilter(std::move(filter)), rateLimiter(std::move(limiter)),
      verifier(std::move(tokenVerifier)), authRequired(requireAuth) {
    if (!ipFilter || !rateLimiter) {
        throw std::invalid_argument("SecurityGate requires an IP filter and a rate limiter");
    }
    if (authRequired && !verifier) {
        throw std::invalid_argument("SecurityGate requires a token verifier when auth is enabled");
    }
}

std::shared_ptr<SecurityGate> SecurityGate::FromConfig(const ServerConfig& config) {
    BanPolicy policy;
    policy.threshold = config.failedAttemptThreshold;
    policy.duration = config.banDuration;
    auto filter = std::make_shared<IPFilter>(config.allowedIps, policy);
    auto limiter = std::make_shared<RateLimiter>(config.rateLimitRequests, config.rateLimitWindow);
    std::shared_ptr<ITokenVerifier> verifier;
    if (config.authEnabled) {
        verifier = std::make_shared<Authenticator>(config.authToken);
    }
    LOG_INFO("Security: auth={} rateLimit={}/{}s allowList={} lockoutThreshold={}",
             config.authEnabled ? "on" : "off", config.rateLimitRequests, config.rateLimitWindow.count(),
             filter->AllowListSize(), policy.threshold);
    return std::make_shared<SecurityGate>(filter, limiter, verifier, config.authEnabled);
}

AdmissionResult SecurityGate::CheckConnection(const std::string& ip) {
    if (ipFilter->IsBlocked(ip)) {
        return AdmissionResult::Deny("IP address blocked due to failed attempts");
    }
    if (!ipFilter->IsAllowed(ip)) {
        return AdmissionResult::Deny("IP address not allowed");
    }
    return AdmissionResult::Allow();
}

AdmissionResult SecurityGate::CheckRateLimit(const std::string& ip) {
    if (!rateLimiter->IsAllowed(ip)) {
        return AdmissionResult::Deny("Rate limit exceeded");
    }
    return AdmissionResult::Allow();
}

AdmissionResult SecurityGate::Authenticate(const std::string& ip, const std::optional<std::string>& token) {
    if (!authRequired) {
        return AdmissionResult::Allow();
    }
    if (!token.has_value() || token->empty()) {
        ipFilter->RecordFailedAttempt(ip);
        return AdmissionResult::Deny("Authentication token required");
    }
    std::string reason;
    if (!verifier->Verify(token.value(), reason)) {
        ipFilter->RecordFailedAttempt(ip);
        return AdmissionResult::Deny(reason.empty() ? std::string("Invalid authentication token") : reason);
    }
    return AdmissionResult::Allow();
}

} // namespace mcpgate::security
