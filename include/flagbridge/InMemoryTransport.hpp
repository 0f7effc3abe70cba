//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// Copyright (c) 2026 flagbridge contributors
// File: InMemoryTransport.hpp
// Purpose: Paired in-process transport that lets tests act as the MCP client of a Server
//==========================================================================================================
#pragma once

#include <memory>
#include <utility>

#include "flagbridge/Transport.h"

namespace flagbridge {

class Logger;

//==========================================================================================================
// InMemoryTransport
// Purpose: Two instances wired back to back. One is handed to Server::Start, the other plays the client
//          and issues tools/call, resources/read and friends through SendRequest.
// Notes:
//   - Each incoming request runs on its own thread, so progress notifications sent while a tool runs
//     reach the peer before the tool's response.
//   - Close() waits for those threads like StdioTransport does.
//==========================================================================================================
class InMemoryTransport : public ITransport {
public:
    explicit InMemoryTransport(std::shared_ptr<Logger> logger = nullptr);
    ~InMemoryTransport() override;

    // first and second deliver to each other.
    static std::pair<std::unique_ptr<InMemoryTransport>, std::unique_ptr<InMemoryTransport>> CreatePair(
        std::shared_ptr<Logger> logger = nullptr);

    std::future<void> Start() override;

    // Also fails requests still awaiting a reply with InternalError "Transport closed".
    std::future<void> Close() override;

    bool IsConnected() const override;

    //==========================================================================================================
    // Client side of a call. A caller-set string or integer id is kept; an empty id gets "mem-req-<n>".
    // Returns:
    //   The peer's response, or an InternalError response when the peer is not connected or this side
    //   closes first.
    //==========================================================================================================
    std::future<std::unique_ptr<JSONRPCResponse>> SendRequest(std::unique_ptr<JSONRPCRequest> request);

    std::future<void> SendNotification(std::unique_ptr<JSONRPCNotification> notification) override;

    void SetRequestHandler(RequestHandler handler) override;
    void SetNotificationHandler(NotificationHandler handler) override;
    void SetErrorHandler(ErrorHandler handler) override;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace flagbridge
