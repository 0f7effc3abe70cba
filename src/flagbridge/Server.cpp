//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// Copyright (c) 2026 flagbridge contributors
// File: Server.cpp
// Purpose: MCP server request dispatch
//==========================================================================================================

#include <atomic>
#include <mutex>
#include <stdexcept>

#include "logging/Logger.h"
#include "flagbridge/ExecutionContext.h"
#include "flagbridge/Protocol.h"
#include "flagbridge/Server.h"
#include "flagbridge/ToolRegistry.h"
#include "flagbridge/errors/Errors.h"
#include "flagbridge/resources/ResourceTemplates.h"
#include "flagbridge/version.h"

namespace flagbridge {

class Server::Impl {
public:
    ServerOptions options;
    std::shared_ptr<Logger> logger;
    ServerBindings bindings;

    mutable std::mutex transportMutex;
    std::unique_ptr<ITransport> transport;
    std::atomic<bool> running{false};

    std::mutex callbackMutex;
    Server::ErrorCallback errorCallback;

    Impl(ServerOptions opts, std::shared_ptr<Logger> log)
        : options(std::move(opts)), logger(log ? std::move(log) : MakeNullLogger()) {
        if (options.version.empty()) {
            options.version = getVersionString();
        }
    }

    static std::unique_ptr<JSONRPCResponse> makeResult(const JSONRPCId& id, JSONValue result) {
        return std::make_unique<JSONRPCResponse>(id, std::move(result));
    }

    std::future<void> sendNotification(std::unique_ptr<JSONRPCNotification> notification) {
        std::lock_guard<std::mutex> lk(transportMutex);
        if (!transport || !transport->IsConnected()) {
            std::promise<void> failed;
            failed.set_exception(std::make_exception_ptr(std::runtime_error("Transport not connected")));
            return failed.get_future();
        }
        return transport->SendNotification(std::move(notification));
    }

    ////////////////////////////////////////// Handlers //////////////////////////////////////////

    std::unique_ptr<JSONRPCResponse> handleInitialize(const JSONRPCRequest& request) {
        if (request.params.has_value()) {
            if (const JSONValue* client = request.params->find("clientInfo")) {
                FLAGBRIDGE_LOG_INFO(*logger, "Initialize from {} {}", GetStringField(*client, "name").value_or("unknown"),
                                    GetStringField(*client, "version").value_or(""));
            }
        }

        JSONValue::Object tools;
        tools["listChanged"] = std::make_shared<JSONValue>(false);
        JSONValue::Object resourcesCap;
        resourcesCap["subscribe"] = std::make_shared<JSONValue>(false);
        resourcesCap["listChanged"] = std::make_shared<JSONValue>(false);
        JSONValue::Object capabilities;
        capabilities["tools"] = std::make_shared<JSONValue>(tools);
        capabilities["resources"] = std::make_shared<JSONValue>(resourcesCap);
        capabilities["logging"] = std::make_shared<JSONValue>(JSONValue::Object{});

        JSONValue::Object serverInfo;
        serverInfo["name"] = std::make_shared<JSONValue>(options.name);
        serverInfo["version"] = std::make_shared<JSONValue>(options.version);

        JSONValue::Object result;
        result["protocolVersion"] = std::make_shared<JSONValue>(PROTOCOL_VERSION);
        result["capabilities"] = std::make_shared<JSONValue>(capabilities);
        result["serverInfo"] = std::make_shared<JSONValue>(serverInfo);
        if (!options.instructions.empty()) {
            result["instructions"] = std::make_shared<JSONValue>(options.instructions);
        }
        return makeResult(request.id, JSONValue{result});
    }

    std::unique_ptr<JSONRPCResponse> handleToolsList(const JSONRPCRequest& request) {
        JSONValue::Array list;
        for (const auto& tool : bindings.tools->registry().List()) {
            list.push_back(std::make_shared<JSONValue>(toJson(tool)));
        }
        JSONValue::Object result;
        result["tools"] = std::make_shared<JSONValue>(std::move(list));
        return makeResult(request.id, JSONValue{result});
    }

    std::unique_ptr<JSONRPCResponse> handleToolsCall(const JSONRPCRequest& request) {
        const JSONValue params = request.params.value_or(JSONValue{});
        auto name = GetStringField(params, "name");
        if (!name.has_value() || name->empty()) {
            return CreateErrorResponse(request.id, JSONRPCErrorCodes::InvalidParams, "Invalid params: missing tool name");
        }
        const JSONValue* arguments = params.find("arguments");
        auto token = progressTokenFromParams(params);
        FLAGBRIDGE_LOG_DEBUG(*logger, "tools/call {} (progressToken={})", name.value(), token.has_value());

        CallToolResult result = bindings.tools->Invoke(name.value(), arguments ? *arguments : JSONValue{}, token);
        return makeResult(request.id, toJson(result));
    }

    std::unique_ptr<JSONRPCResponse> handleTemplatesList(const JSONRPCRequest& request) {
        JSONValue::Array list;
        for (const auto& t : bindings.resources->ListTemplates()) {
            list.push_back(std::make_shared<JSONValue>(toJson(t)));
        }
        JSONValue::Object result;
        result["resourceTemplates"] = std::make_shared<JSONValue>(std::move(list));
        return makeResult(request.id, JSONValue{result});
    }

    std::unique_ptr<JSONRPCResponse> handleResourcesRead(const JSONRPCRequest& request) {
        const JSONValue params = request.params.value_or(JSONValue{});
        auto uri = GetStringField(params, "uri");
        if (!uri.has_value() || uri->empty()) {
            return CreateErrorResponse(request.id, JSONRPCErrorCodes::InvalidParams, "Invalid params: missing uri");
        }
        try {
            return makeResult(request.id, toJson(bindings.resources->Read(uri.value(), *bindings.context)));
        } catch (const std::exception&) {
            const auto normalized = errors::normalizeError(std::current_exception());
            FLAGBRIDGE_LOG_ERROR(*logger, "Error reading resource {}: [{}] {}", uri.value(),
                                 errors::errorKindName(normalized.kind), normalized.message);
            return errors::makeErrorResponse(request.id, normalized);
        }
    }

    std::unique_ptr<JSONRPCResponse> handleSetLogLevel(const JSONRPCRequest& request) {
        const JSONValue params = request.params.value_or(JSONValue{});
        FLAGBRIDGE_LOG_DEBUG(*logger, "Client requested log level {}; server threshold is fixed at startup",
                             GetStringField(params, "level").value_or("?"));
        return makeResult(request.id, JSONValue{JSONValue::Object{}});
    }

    std::unique_ptr<JSONRPCResponse> dispatchRequest(const JSONRPCRequest& req) {
        try {
            if (req.method == Methods::Initialize) {
                return handleInitialize(req);
            } else if (req.method == Methods::Ping) {
                return makeResult(req.id, JSONValue{JSONValue::Object{}});
            } else if (req.method == Methods::ListTools) {
                return handleToolsList(req);
            } else if (req.method == Methods::CallTool) {
                return handleToolsCall(req);
            } else if (req.method == Methods::ListResourceTemplates) {
                return handleTemplatesList(req);
            } else if (req.method == Methods::ListResources) {
                JSONValue::Object result;
                result["resources"] = std::make_shared<JSONValue>(JSONValue::Array{});
                return makeResult(req.id, JSONValue{result});
            } else if (req.method == Methods::ReadResource) {
                return handleResourcesRead(req);
            } else if (req.method == Methods::SetLogLevel) {
                return handleSetLogLevel(req);
            }
            return CreateErrorResponse(req.id, JSONRPCErrorCodes::MethodNotFound, "Method not found: " + req.method);
        } catch (const std::exception& e) {
            FLAGBRIDGE_LOG_ERROR(*logger, "Request {} failed: {}", req.method, e.what());
            return CreateErrorResponse(req.id, JSONRPCErrorCodes::InternalError, e.what());
        }
    }

    void handleNotification(std::unique_ptr<JSONRPCNotification> n) {
        if (n->method == Methods::Initialized) {
            FLAGBRIDGE_LOG_INFO(*logger, "Client initialized");
        } else if (n->method == Methods::Cancelled) {
            // In-flight remote calls are not interrupted; the late result is still sent.
            FLAGBRIDGE_LOG_DEBUG(*logger, "Cancellation requested; ignored");
        } else {
            FLAGBRIDGE_LOG_DEBUG(*logger, "Ignoring notification {}", n->method);
        }
    }

    void handleTransportError(const std::string& err) {
        FLAGBRIDGE_LOG_WARN(*logger, "Transport error: {}", err);
        Server::ErrorCallback cb;
        {
            std::lock_guard<std::mutex> lk(callbackMutex);
            cb = errorCallback;
        }
        if (cb) {
            try {
                cb(err);
            } catch (const std::exception& e) {
                FLAGBRIDGE_LOG_ERROR(*logger, "Server error callback exception: {}", e.what());
            }
        }
    }
};

Server::Server(ServerOptions options, std::shared_ptr<Logger> logger)
    : pImpl(std::make_unique<Impl>(std::move(options), std::move(logger))) {}

Server::~Server() {
    if (pImpl->running.load()) {
        Stop().wait();
    }
}

NotificationSender Server::GetNotificationSender() {
    Impl* impl = pImpl.get();
    return [impl](std::unique_ptr<JSONRPCNotification> notification) {
        return impl->sendNotification(std::move(notification));
    };
}

std::future<void> Server::Start(std::unique_ptr<ITransport> transport, ServerBindings bindings) {
    if (!transport) {
        throw std::invalid_argument("Server::Start: transport is required");
    }
    if (!bindings.context || !bindings.tools || !bindings.resources) {
        throw std::invalid_argument("Server::Start: context, tool dispatcher and resource router are required");
    }
    pImpl->bindings = std::move(bindings);

    Impl* impl = pImpl.get();
    transport->SetRequestHandler([impl](const JSONRPCRequest& req) { return impl->dispatchRequest(req); });
    transport->SetNotificationHandler([impl](std::unique_ptr<JSONRPCNotification> n) {
        if (n) impl->handleNotification(std::move(n));
    });
    transport->SetErrorHandler([impl](const std::string& err) { impl->handleTransportError(err); });

    std::future<void> started;
    {
        std::lock_guard<std::mutex> lk(pImpl->transportMutex);
        pImpl->transport = std::move(transport);
        started = pImpl->transport->Start();
    }
    pImpl->running = true;
    FLAGBRIDGE_LOG_INFO(*pImpl->logger, "{} {} serving {} tool(s), {} resource template(s)", pImpl->options.name,
                        pImpl->options.version, pImpl->bindings.tools->registry().Size(),
                        pImpl->bindings.resources->Size());
    return started;
}

std::future<void> Server::Stop() {
    pImpl->running = false;
    ITransport* t = nullptr;
    {
        std::lock_guard<std::mutex> lk(pImpl->transportMutex);
        t = pImpl->transport.get();
    }
    if (!t) {
        std::promise<void> done;
        done.set_value();
        return done.get_future();
    }
    FLAGBRIDGE_LOG_INFO(*pImpl->logger, "Stopping server");
    return t->Close();
}

bool Server::IsRunning() const {
    std::lock_guard<std::mutex> lk(pImpl->transportMutex);
    return pImpl->running.load() && pImpl->transport && pImpl->transport->IsConnected();
}

void Server::SetErrorCallback(ErrorCallback callback) {
    std::lock_guard<std::mutex> lk(pImpl->callbackMutex);
    pImpl->errorCallback = std::move(callback);
}

} // namespace flagbridge
