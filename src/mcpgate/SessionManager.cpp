//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SessionManager.cpp
// Purpose: Session registry implementation
//==========================================================================================================

#include <array>
#include <stdexcept>

#include <fmt/format.h>
#include <openssl/rand.h>

#include "logging/Logger.h"
#include "mcpgate/SessionManager.hpp"

namespace mcpgate {

SessionManager::SessionManager(NowFn nowFn) : now(std::move(nowFn)) {
    if (!now) {
        now = []() { return Clock::now(); };
    }
}

std::string SessionManager::GenerateClientId() {
    std::array<unsigned char, 8> bytes{};
    if (::RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed while generating client id");
    }
    std::string out;
    out.reserve(bytes.size() * 2);
    for (unsigned char b : bytes) {
        out += fmt::format("{:02x}", static_cast<unsigned int>(b));
    }
    return out;
}

std::shared_ptr<ClientSession> SessionManager::CreateSession(const std::string& ipAddress,
                                                             std::optional<std::string> userAgent) {
    auto session = std::make_shared<ClientSession>();
    session->ipAddress = ipAddress;
    session->userAgent = std::move(userAgent);

    std::lock_guard<std::mutex> lock(mtx);
    // Collisions over 64 random bits are practically impossible; regenerate anyway.
    do {
        session->clientId = GenerateClientId();
    } while (sessions.count(session->clientId) != 0);
    session->connectedAt = now();
    session->lastActivity = session->connectedAt;
    sessions[session->clientId] = session;
    LOG_DEBUG("Session created: {} ({})", session->clientId, ipAddress);
    return session;
}

std::shared_ptr<ClientSession> SessionManager::GetSession(const std::string& clientId) const {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = sessions.find(clientId);
    if (it == sessions.end()) {
        return nullptr;
    }
    return it->second;
}

bool SessionManager::UpdateSession(const std::shared_ptr<ClientSession>& session) {
    if (!session) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mtx);
    session->lastActivity = now();
    ++session->requestCount;
    auto [it, inserted] = sessions.emplace(session->clientId, session);
    (void)it;
    if (inserted) {
        LOG_INFO("Session {} re-registered after expiry sweep", session->clientId);
    }
    return inserted;
}

void SessionManager::MarkAuthenticated(const std::shared_ptr<ClientSession>& session) {
    std::lock_guard<std::mutex> lock(mtx);
    session->authenticated = true;
}

void SessionManager::SetUserAgent(const std::shared_ptr<ClientSession>& session, const std::string& userAgent) {
    std::lock_guard<std::mutex> lock(mtx);
    session->userAgent = userAgent;
}

bool SessionManager::RemoveSession(const std::string& clientId) {
    std::lock_guard<std::mutex> lock(mtx);
    return sessions.erase(clientId) > 0;
}

std::size_t SessionManager::CleanupExpiredSessions(std::chrono::seconds maxAge) {
    std::lock_guard<std::mutex> lock(mtx);
    const auto cutoff = now() - maxAge;
    std::size_t removed = 0;
    for (auto it = sessions.begin(); it != sessions.end();) {
        if (it->second->lastActivity < cutoff) {
            LOG_INFO("Expiring idle session {} ({})", it->first, it->second->ipAddress);
            it = sessions.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

std::size_t SessionManager::SessionCount() const {
    std::lock_guard<std::mutex> lock(mtx);
    return sessions.size();
}

std::vector<ClientSession> SessionManager::ListSessions() const {
    std::lock_guard<std::mutex> lock(mtx);
    std::vector<ClientSession> out;
    out.reserve(sessions.size());
    for (const auto& kv : sessions) {
        out.push_back(*kv.second);
    }
    return out;
}

} // namespace mcpgate
