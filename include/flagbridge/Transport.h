//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// Copyright (c) 2026 flagbridge contributors
// File: Transport.h
// Purpose: Server-side JSON-RPC transport seam used by the flag bridge
//==========================================================================================================

#pragma once

#include <functional>
#include <future>
#include <memory>
#include <string>

namespace flagbridge {

class JSONRPCRequest;
class JSONRPCResponse;
class JSONRPCNotification;

//==========================================================================================================
// ITransport
// Purpose: Carries one MCP client session into the Server. Incoming requests are answered through the
//          request handler; the server pushes progress and log notifications back with SendNotification.
// Notes:
//   - Handlers are installed by Server::Start before Start() is called and are not replaced afterwards.
//   - The server never issues requests of its own, so there is no outgoing-request surface here.
//==========================================================================================================
class ITransport {
public:
    virtual ~ITransport() = default;

    virtual std::future<void> Start() = 0;

    //==========================================================================================================
    // Stops delivering input and returns once no handler is running any more. After the returned future
    // is ready the transport never calls back into its handlers, so the owner may be destroyed.
    //==========================================================================================================
    virtual std::future<void> Close() = 0;

    virtual bool IsConnected() const = 0;

    // The future carries std::runtime_error when the notification could not be queued.
    virtual std::future<void> SendNotification(std::unique_ptr<JSONRPCNotification> notification) = 0;

    // Returns the response for one incoming request; tools/call may block here for the whole tool run.
    using RequestHandler = std::function<std::unique_ptr<JSONRPCResponse>(const JSONRPCRequest&)>;
    // notifications/initialized, notifications/cancelled and anything else the client announces.
    using NotificationHandler = std::function<void(std::unique_ptr<JSONRPCNotification>)>;
    // End of input ("stdin closed") or an unrecoverable I/O failure.
    using ErrorHandler = std::function<void(const std::string& error)>;

    virtual void SetRequestHandler(RequestHandler handler) = 0;
    virtual void SetNotificationHandler(NotificationHandler handler) = 0;
    virtual void SetErrorHandler(ErrorHandler handler) = 0;
};

} // namespace flagbridge
