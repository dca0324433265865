//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SessionManager.hpp
// Purpose: Thread-safe registry of live client sessions with idle expiry
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "mcpgate/ClientSession.h"

namespace mcpgate {

class SessionManager {
public:
    using Clock = ClientSession::Clock;
    using NowFn = std::function<Clock::time_point()>;

    //==========================================================================================================
    // Constructs an empty registry.
    // Args:
    //   now: Time source; defaults to system_clock::now. Tests inject a simulated clock.
    //==========================================================================================================
    explicit SessionManager(NowFn now = {});

    //==========================================================================================================
    // Creates and registers a session with a fresh random client id.
    // Args:
    //   ipAddress: Peer address.
    //   userAgent: Optional descriptive string.
    // Returns:
    //   Shared session; the caller (ConnectionHandler) owns its mutation.
    //==========================================================================================================
    std::shared_ptr<ClientSession> CreateSession(const std::string& ipAddress,
                                                 std::optional<std::string> userAgent = std::nullopt);

    //==========================================================================================================
    // Looks up a session by client id.
    // Returns:
    //   The session or nullptr when unknown (never registered, removed, or swept).
    //==========================================================================================================
    std::shared_ptr<ClientSession> GetSession(const std::string& clientId) const;

    //==========================================================================================================
    // Records an accepted request: bumps lastActivity and requestCount. A session that the expiry sweep
    // removed while its connection stayed open is registered again.
    // Returns:
    //   true when the session had to be re-registered.
    //==========================================================================================================
    bool UpdateSession(const std::shared_ptr<ClientSession>& session);

    // Flag and user-agent updates go through the registry lock so ListSessions sees consistent copies.
    void MarkAuthenticated(const std::shared_ptr<ClientSession>& session);
    void SetUserAgent(const std::shared_ptr<ClientSession>& session, const std::string& userAgent);

    // Removes the session; returns false when it was not registered.
    bool RemoveSession(const std::string& clientId);

    //==========================================================================================================
    // Evicts every session whose lastActivity predates now - maxAge. Sockets are not touched.
    // Returns:
    //   Number of sessions removed.
    //==========================================================================================================
    std::size_t CleanupExpiredSessions(std::chrono::seconds maxAge);

    std::size_t SessionCount() const;

    // Copies of the registered sessions, for diagnostics tools.
    std::vector<ClientSession> ListSessions() const;

    // Hex client id from 8 random bytes (OpenSSL RAND_bytes).
    static std::string GenerateClientId();

private:
    NowFn now;
    mutable std::mutex mtx;
    std::unordered_map<std::string, std::shared_ptr<ClientSession>> sessions;
};

} // namespace mcpgate
