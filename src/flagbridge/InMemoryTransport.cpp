//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// Copyright (c) 2026 flagbridge contributors
// File: InMemoryTransport.cpp
// Purpose: Paired in-process transport implementation
//==========================================================================================================

#include <atomic>
#include <condition_variable>
#include <future>
#include <map>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <thread>

#include "logging/Logger.h"
#include "flagbridge/InMemoryTransport.hpp"
#include "flagbridge/JSONRPCTypes.h"
#include "flagbridge/JsonRpcMessageRouter.h"

namespace flagbridge {

class InMemoryTransport::Impl {
public:
    std::shared_ptr<Logger> logger;
    std::atomic<bool> connected{false};
    RouterHandlers handlers;
    std::unique_ptr<IJsonRpcMessageRouter> router;

    InMemoryTransport::Impl* peer = nullptr;
    std::mutex peerMutex;

    std::queue<std::string> inbox;
    std::mutex inboxMutex;
    std::condition_variable inboxCondition;
    std::jthread deliveryThread;

    std::atomic<unsigned int> nextRequestId{0u};
    std::mutex callsMutex;
    std::map<std::string, std::promise<std::unique_ptr<JSONRPCResponse>>> awaitingReply;

    // Same contract as StdioTransport: no handler starts after Close(), and Close() waits for the rest.
    std::mutex handlerMutex;
    std::condition_variable handlerCondition;
    std::size_t runningHandlers{0};
    bool accepting{true};

    explicit Impl(std::shared_ptr<Logger> log)
        : logger(log ? std::move(log) : MakeNullLogger()), router(MakeDefaultJsonRpcMessageRouter(logger)) {}

    ~Impl() {
        stopHandlers();
        connected = false;
        inboxCondition.notify_all();
        if (deliveryThread.joinable()) {
            deliveryThread.request_stop();
            deliveryThread.join();
        }
    }

    bool enterHandler() {
        std::lock_guard<std::mutex> lk(handlerMutex);
        if (!accepting) {
            return false;
        }
        ++runningHandlers;
        return true;
    }

    void leaveHandler() {
        std::lock_guard<std::mutex> lk(handlerMutex);
        --runningHandlers;
        handlerCondition.notify_all();
    }

    void stopHandlers() {
        std::unique_lock<std::mutex> lk(handlerMutex);
        accepting = false;
        handlerCondition.wait(lk, [this]() { return runningHandlers == 0; });
    }

    void startDelivery() {
        deliveryThread = std::jthread([this](std::stop_token st) {
            std::unique_lock<std::mutex> lock(inboxMutex);
            while (!st.stop_requested()) {
                inboxCondition.wait(lock, [&]() { return !inbox.empty() || !connected || st.stop_requested(); });
                if (!connected || st.stop_requested()) {
                    break;
                }
                std::string frame = std::move(inbox.front());
                inbox.pop();
                lock.unlock();
                deliver(frame);
                lock.lock();
            }
        });
    }

    void deliver(const std::string& frame) {
        FLAGBRIDGE_LOG_DEBUG(*logger, "InMemoryTransport: received {}", frame);
        JSONValue doc;
        auto kind = router->classify(frame, doc);
        auto resolve = [this](JSONRPCResponse&& response) { completeCall(std::move(response)); };
        if (!enterHandler()) {
            return;
        }
        if (kind != IJsonRpcMessageRouter::MessageKind::Request) {
            if (auto reply = router->route(kind, doc, handlers, resolve)) {
                sendToPeer(reply.value());
            }
            leaveHandler();
            return;
        }
        std::thread([this, kind, doc = std::move(doc), resolve]() mutable {
            if (auto reply = router->route(kind, doc, handlers, resolve)) {
                sendToPeer(reply.value());
            }
            leaveHandler();
        }).detach();
    }

    void completeCall(JSONRPCResponse response) {
        const std::string key = JsonRpcIdToString(response.id);
        std::lock_guard<std::mutex> lock(callsMutex);
        auto it = awaitingReply.find(key);
        if (it == awaitingReply.end()) {
            FLAGBRIDGE_LOG_DEBUG(*logger, "InMemoryTransport: no call waiting for id {}", key);
            return;
        }
        it->second.set_value(std::make_unique<JSONRPCResponse>(std::move(response)));
        awaitingReply.erase(it);
    }

    void failCall(const std::string& key, const JSONRPCId& id, const std::string& why) {
        std::lock_guard<std::mutex> lock(callsMutex);
        auto it = awaitingReply.find(key);
        if (it != awaitingReply.end()) {
            it->second.set_value(CreateErrorResponse(id, JSONRPCErrorCodes::InternalError, why));
            awaitingReply.erase(it);
        }
    }

    void post(const std::string& frame) {
        {
            std::lock_guard<std::mutex> lock(inboxMutex);
            inbox.push(frame);
        }
        inboxCondition.notify_one();
    }

    bool sendToPeer(const std::string& frame) {
        std::lock_guard<std::mutex> lock(peerMutex);
        if (!peer || !peer->connected.load()) {
            FLAGBRIDGE_LOG_WARN(*logger, "InMemoryTransport: peer not connected; dropping frame");
            return false;
        }
        peer->post(frame);
        return true;
    }
};

InMemoryTransport::InMemoryTransport(std::shared_ptr<Logger> logger) : pImpl(std::make_unique<Impl>(std::move(logger))) {}

InMemoryTransport::~InMemoryTransport() {
    // Unlink both directions first so the peer stops posting into this instance.
    Impl* peer = nullptr;
    {
        std::lock_guard<std::mutex> lock(pImpl->peerMutex);
        peer = pImpl->peer;
        pImpl->peer = nullptr;
    }
    if (peer) {
        std::lock_guard<std::mutex> lock(peer->peerMutex);
        if (peer->peer == pImpl.get()) {
            peer->peer = nullptr;
        }
    }
}

std::pair<std::unique_ptr<InMemoryTransport>, std::unique_ptr<InMemoryTransport>> InMemoryTransport::CreatePair(
    std::shared_ptr<Logger> logger) {
    auto first = std::make_unique<InMemoryTransport>(logger);
    auto second = std::make_unique<InMemoryTransport>(logger);
    first->pImpl->peer = second->pImpl.get();
    second->pImpl->peer = first->pImpl.get();
    return {std::move(first), std::move(second)};
}

std::future<void> InMemoryTransport::Start() {
    FLAGBRIDGE_LOG_DEBUG(*pImpl->logger, "Starting InMemoryTransport");
    pImpl->connected = true;
    pImpl->startDelivery();
    std::promise<void> ready;
    ready.set_value();
    return ready.get_future();
}

std::future<void> InMemoryTransport::Close() {
    FLAGBRIDGE_LOG_DEBUG(*pImpl->logger, "Closing InMemoryTransport");
    pImpl->connected = false;
    pImpl->inboxCondition.notify_all();
    pImpl->stopHandlers();
    {
        std::lock_guard<std::mutex> lock(pImpl->callsMutex);
        for (auto& [key, waiting] : pImpl->awaitingReply) {
            waiting.set_value(CreateErrorResponse(key, JSONRPCErrorCodes::InternalError, "Transport closed"));
        }
        pImpl->awaitingReply.clear();
    }
    std::promise<void> done;
    done.set_value();
    return done.get_future();
}

bool InMemoryTransport::IsConnected() const { return pImpl->connected; }

std::future<std::unique_ptr<JSONRPCResponse>> InMemoryTransport::SendRequest(std::unique_ptr<JSONRPCRequest> request) {
    std::string key = JsonRpcIdToString(request->id);
    if (std::holds_alternative<std::nullptr_t>(request->id) || key.empty()) {
        key = "mem-req-" + std::to_string(++pImpl->nextRequestId);
        request->id = key;
    }
    std::promise<std::unique_ptr<JSONRPCResponse>> reply;
    auto future = reply.get_future();
    {
        std::lock_guard<std::mutex> lock(pImpl->callsMutex);
        pImpl->awaitingReply[key] = std::move(reply);
    }
    if (!pImpl->sendToPeer(request->Serialize())) {
        pImpl->failCall(key, request->id, "Peer not connected");
    }
    return future;
}

std::future<void> InMemoryTransport::SendNotification(std::unique_ptr<JSONRPCNotification> notification) {
    std::promise<void> sent;
    auto future = sent.get_future();
    if (pImpl->sendToPeer(notification->Serialize())) {
        sent.set_value();
    } else {
        sent.set_exception(std::make_exception_ptr(std::runtime_error("Peer not connected")));
    }
    return future;
}

void InMemoryTransport::SetRequestHandler(RequestHandler handler) {
    pImpl->handlers.requestHandler = std::move(handler);
}

void InMemoryTransport::SetNotificationHandler(NotificationHandler handler) {
    pImpl->handlers.notificationHandler = std::move(handler);
}

void InMemoryTransport::SetErrorHandler(ErrorHandler handler) {
    pImpl->handlers.errorHandler = std::move(handler);
}

} // namespace flagbridge
