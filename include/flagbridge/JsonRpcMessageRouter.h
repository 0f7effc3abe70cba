//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// Copyright (c) 2026 flagbridge contributors
// File: JsonRpcMessageRouter.h
// Purpose: Frame classification and dispatch shared by the stdio and in-memory transports
//==========================================================================================================

#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "flagbridge/JSONRPCTypes.h"
#include "flagbridge/Transport.h"

namespace flagbridge {

class Logger;

// Handlers a transport forwards decoded frames to; normally the ones Server::Start installed.
struct RouterHandlers {
    ITransport::RequestHandler requestHandler;
    ITransport::NotificationHandler notificationHandler;
    ITransport::ErrorHandler errorHandler;
};

// Receives response frames. Only the in-memory test client has requests outstanding.
using ResponseResolver = std::function<void(JSONRPCResponse&&)>;

//==========================================================================================================
// IJsonRpcMessageRouter
// Purpose: Turns one text frame into a handler call and, where JSON-RPC demands one, a reply frame.
// Notes:
//   - A request without a request handler is answered with MethodNotFound.
//   - A request handler that throws is answered with InternalError carrying the exception text.
//   - Invalid and unparseable frames are answered with InvalidRequest / ParseError and a null id.
//==========================================================================================================
class IJsonRpcMessageRouter {
public:
    virtual ~IJsonRpcMessageRouter() = default;

    enum class MessageKind {
        Request,
        Response,
        Notification,
        Invalid,     // JSON, but neither request, response nor notification
        Unparseable  // not JSON
    };

    // doc receives the parsed frame when it is JSON.
    virtual MessageKind classify(const std::string& json, JSONValue& doc) = 0;

    // Returns the serialized reply to write back, or std::nullopt for responses and notifications.
    virtual std::optional<std::string> route(MessageKind kind, const JSONValue& doc, RouterHandlers& handlers,
                                             const ResponseResolver& resolve) = 0;
};

std::unique_ptr<IJsonRpcMessageRouter> MakeDefaultJsonRpcMessageRouter(std::shared_ptr<Logger> logger);

} // namespace flagbridge
