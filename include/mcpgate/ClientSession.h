//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ClientSession.h
// Purpose: Server-side state of one connected client
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace mcpgate {

//==========================================================================================================
// ClientSession
// Purpose: Identity and activity of one connection.
// Fields:
//   clientId: Random hex id generated at connect time.
//   ipAddress: Peer address; immutable for the session lifetime.
//   connectedAt / lastActivity: Wall-clock time points; lastActivity moves on every accepted request.
//   requestCount: Accepted requests so far.
//   authenticated: True once a valid token was presented (or auth is disabled).
//   userAgent: Optional client description taken from initialize.clientInfo.
// Notes:
//   Owned by its ConnectionHandler. lastActivity/requestCount are written through SessionManager so
//   that the expiry sweep reads them under the same lock.
//==========================================================================================================
struct ClientSession {
    using Clock = std::chrono::system_clock;

    std::string clientId;
    std::string ipAddress;
    Clock::time_point connectedAt{};
    Clock::time_point lastActivity{};
    uint64_t requestCount{0};
    bool authenticated{false};
    std::optional<std::string> userAgent;
};

} // namespace mcpgate
