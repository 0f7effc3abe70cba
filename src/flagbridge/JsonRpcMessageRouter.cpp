//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// Copyright (c) 2026 flagbridge contributors
// File: JsonRpcMessageRouter.cpp
// Purpose: Default implementation for JSON-RPC message routing
//========================================================================================================

#include <optional>
#include <string>

#include "logging/Logger.h"
#include "flagbridge/JsonRpcMessageRouter.h"
#include "flagbridge/JSONRPCTypes.h"

namespace flagbridge {

namespace {

class JsonRpcMessageRouter : public IJsonRpcMessageRouter {
public:
    explicit JsonRpcMessageRouter(std::shared_ptr<Logger> logger)
        : logger(logger ? std::move(logger) : MakeNullLogger()) {}

    MessageKind classify(const std::string& json, JSONValue& doc) override {
        try {
            doc = ParseJson(json);
        } catch (const JsonParseError& e) {
            FLAGBRIDGE_LOG_DEBUG(*logger, "Router: unparseable frame: {}", e.what());
            return MessageKind::Unparseable;
        }
        if (!doc.isObject()) {
            return MessageKind::Invalid;
        }
        if (doc.find("result") || doc.find("error")) {
            return MessageKind::Response;
        }
        if (GetStringField(doc, "method").has_value()) {
            return doc.find("id") ? MessageKind::Request : MessageKind::Notification;
        }
        return MessageKind::Invalid;
    }

    std::optional<std::string> route(
        MessageKind kind,
        const JSONValue& doc,
        RouterHandlers& handlers,
        const ResponseResolver& resolve) override {
        switch (kind) {
            case MessageKind::Unparseable:
                return CreateErrorResponse(nullptr, JSONRPCErrorCodes::ParseError, "Parse error")->Serialize();
            case MessageKind::Invalid:
                return CreateErrorResponse(nullptr, JSONRPCErrorCodes::InvalidRequest, "Invalid Request")->Serialize();
            case MessageKind::Response: {
                JSONRPCResponse response;
                if (response.FromJson(doc)) {
                    resolve(std::move(response));
                } else {
                    FLAGBRIDGE_LOG_WARN(*logger, "Router: dropping malformed response");
                }
                return std::nullopt;
            }
            case MessageKind::Notification: {
                auto notification = std::make_unique<JSONRPCNotification>();
                if (notification->FromJson(doc) && handlers.notificationHandler) {
                    try {
                        handlers.notificationHandler(std::move(notification));
                    } catch (const std::exception& e) {
                        FLAGBRIDGE_LOG_ERROR(*logger, "Notification handler exception: {}", e.what());
                    }
                }
                return std::nullopt;
            }
            case MessageKind::Request:
                break;
        }

        JSONRPCRequest request;
        if (!request.FromJson(doc)) {
            return CreateErrorResponse(nullptr, JSONRPCErrorCodes::InvalidRequest, "Invalid Request")->Serialize();
        }
        if (!handlers.requestHandler) {
            return CreateErrorResponse(request.id, JSONRPCErrorCodes::MethodNotFound, "Method not found")->Serialize();
        }
        std::unique_ptr<JSONRPCResponse> resp;
        try {
            resp = handlers.requestHandler(request);
        } catch (const std::exception& e) {
            FLAGBRIDGE_LOG_ERROR(*logger, "Request handler exception: {}", e.what());
            resp = CreateErrorResponse(request.id, JSONRPCErrorCodes::InternalError, e.what());
        }
        if (!resp) {
            resp = CreateErrorResponse(request.id, JSONRPCErrorCodes::InternalError, "Null response from handler");
        }
        resp->id = request.id;
        return resp->Serialize();
    }

private:
    std::shared_ptr<Logger> logger;
};

} // namespace

std::unique_ptr<IJsonRpcMessageRouter> MakeDefaultJsonRpcMessageRouter(std::shared_ptr<Logger> logger) {
    return std::make_unique<JsonRpcMessageRouter>(std::move(logger));
}

} // namespace flagbridge
