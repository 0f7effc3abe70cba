//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// Copyright (c) 2026 flagbridge contributors
// File: StdioTransport.cpp
// Purpose: Newline-delimited stdio transport implementation
//==========================================================================================================

#include <atomic>
#include <condition_variable>
#include <deque>
#include <future>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>

#include "logging/Logger.h"
#include "flagbridge/JSONRPCTypes.h"
#include "flagbridge/JsonRpcMessageRouter.h"
#include "flagbridge/StdioTransport.hpp"

namespace flagbridge {

class StdioTransport::Impl : public std::enable_shared_from_this<StdioTransport::Impl> {
public:
    std::istream& in;
    std::ostream& out;
    std::shared_ptr<Logger> logger;
    std::atomic<bool> connected{false};
    std::atomic<bool> readerExited{false};

    RouterHandlers handlers;
    std::unique_ptr<IJsonRpcMessageRouter> router;

    std::thread readerThread;
    std::thread writerThread;
    std::mutex writeMutex;  // protects writeQueue and queuedBytes
    std::condition_variable cvWrite;
    std::deque<std::string> writeQueue;
    std::size_t queuedBytes{0};
    std::size_t writeQueueMaxBytes{2 * 1024 * 1024};

    // Handler calls in progress. Once Close() clears accepting no new call starts, and Close() returns
    // only after the count drains, so handlers never run after the transport owner is gone.
    std::mutex inflightMutex;
    std::condition_variable inflightCondition;
    std::size_t inflight{0};
    bool accepting{true};

    Impl(std::istream& i, std::ostream& o, std::shared_ptr<Logger> log)
        : in(i), out(o), logger(log ? std::move(log) : MakeNullLogger()) {
        router = MakeDefaultJsonRpcMessageRouter(logger);
    }

    bool enterHandler() {
        std::lock_guard<std::mutex> lk(inflightMutex);
        if (!accepting) {
            return false;
        }
        ++inflight;
        return true;
    }

    void leaveHandler() {
        std::lock_guard<std::mutex> lk(inflightMutex);
        --inflight;
        inflightCondition.notify_all();
    }

    void setError(const std::string& msg) {
        FLAGBRIDGE_LOG_DEBUG(*logger, "StdioTransport: {}", msg);
        if (!enterHandler()) {
            return;
        }
        if (handlers.errorHandler) {
            handlers.errorHandler(msg);
        }
        leaveHandler();
    }

    bool enqueueFrame(std::string frame) {
        {
            std::lock_guard<std::mutex> lk(writeMutex);
            if (!connected.load()) {
                return false;
            }
            if (queuedBytes + frame.size() + 1 > writeQueueMaxBytes) {
                FLAGBRIDGE_LOG_ERROR(*logger, "StdioTransport: write queue overflow (queued={} add={} max={})",
                                     queuedBytes, frame.size(), writeQueueMaxBytes);
                return false;
            }
            queuedBytes += frame.size() + 1;
            writeQueue.emplace_back(std::move(frame));
        }
        cvWrite.notify_one();
        return true;
    }

    void processLine(const std::string& line) {
        JSONValue doc;
        auto kind = router->classify(line, doc);
        // The server sends no requests, so any response frame is unsolicited.
        auto resolve = [this](JSONRPCResponse&& response) {
            FLAGBRIDGE_LOG_DEBUG(*logger, "StdioTransport: ignoring response for id {}", JsonRpcIdToString(response.id));
        };
        if (!enterHandler()) {
            FLAGBRIDGE_LOG_DEBUG(*logger, "StdioTransport: closing; ignoring late input");
            return;
        }
        if (kind != IJsonRpcMessageRouter::MessageKind::Request) {
            if (auto reply = router->route(kind, doc, handlers, resolve)) {
                enqueueFrame(std::move(reply.value()));
            }
            leaveHandler();
            return;
        }
        std::thread([self = shared_from_this(), kind, doc = std::move(doc), resolve]() mutable {
            if (auto reply = self->router->route(kind, doc, self->handlers, resolve)) {
                if (!self->enqueueFrame(std::move(reply.value()))) {
                    FLAGBRIDGE_LOG_WARN(*self->logger, "StdioTransport: response dropped (disconnected or queue full)");
                }
            }
            self->leaveHandler();
        }).detach();
    }

    void startReader() {
        readerThread = std::thread([self = shared_from_this()]() {
            std::string line;
            while (self->connected.load() && std::getline(self->in, line)) {
                if (!line.empty() && line.back() == '\r') {
                    line.pop_back();
                }
                if (line.find_first_not_of(" \t") == std::string::npos) {
                    continue;
                }
                self->processLine(line);
            }
            self->readerExited = true;
            if (self->connected.load()) {
                FLAGBRIDGE_LOG_INFO(*self->logger, "StdioTransport: stdin closed");
                self->setError("stdin closed");
            }
        });
    }

    void startWriter() {
        writerThread = std::thread([this]() {
            while (true) {
                std::string frame;
                {
                    std::unique_lock<std::mutex> lk(writeMutex);
                    cvWrite.wait(lk, [&] { return !connected.load() || !writeQueue.empty(); });
                    if (writeQueue.empty()) {
                        break;
                    }
                    frame = std::move(writeQueue.front());
                    writeQueue.pop_front();
                    queuedBytes -= frame.size() + 1;
                }
                out << frame << '\n';
                out.flush();
                if (!out) {
                    setError("stdout write failed");
                    break;
                }
            }
        });
    }
};

StdioTransport::StdioTransport(std::shared_ptr<Logger> logger)
    : pImpl(std::make_shared<Impl>(std::cin, std::cout, std::move(logger))) {}

StdioTransport::StdioTransport(std::istream& in, std::ostream& out, std::shared_ptr<Logger> logger)
    : pImpl(std::make_shared<Impl>(in, out, std::move(logger))) {}

StdioTransport::~StdioTransport() {
    if (pImpl->connected.load()) {
        Close().wait();
    }
}

std::future<void> StdioTransport::Start() {
    FLAGBRIDGE_LOG_INFO(*pImpl->logger, "Starting StdioTransport");
    pImpl->connected = true;
    pImpl->startWriter();
    pImpl->startReader();
    std::promise<void> ready;
    ready.set_value();
    return ready.get_future();
}

std::future<void> StdioTransport::Close() {
    FLAGBRIDGE_LOG_INFO(*pImpl->logger, "Closing StdioTransport");
    {
        // In-flight requests still get their responses written; no handler starts afterwards.
        std::unique_lock<std::mutex> lk(pImpl->inflightMutex);
        pImpl->accepting = false;
        pImpl->inflightCondition.wait(lk, [this]() { return pImpl->inflight == 0; });
    }
    {
        std::lock_guard<std::mutex> lk(pImpl->writeMutex);
        pImpl->connected = false;
    }
    pImpl->cvWrite.notify_all();
    if (pImpl->writerThread.joinable()) {
        pImpl->writerThread.join();
    }
    if (pImpl->readerThread.joinable()) {
        if (pImpl->readerExited.load()) {
            pImpl->readerThread.join();
        } else {
            // A blocked getline cannot be interrupted; the thread owns a reference to the state.
            FLAGBRIDGE_LOG_DEBUG(*pImpl->logger, "StdioTransport: reader still blocked on input; detaching");
            pImpl->readerThread.detach();
        }
    }
    std::promise<void> done;
    done.set_value();
    return done.get_future();
}

bool StdioTransport::IsConnected() const { return pImpl->connected.load(); }

std::future<void> StdioTransport::SendNotification(std::unique_ptr<JSONRPCNotification> notification) {
    std::promise<void> promise;
    auto future = promise.get_future();
    if (pImpl->enqueueFrame(notification->Serialize())) {
        promise.set_value();
    } else {
        promise.set_exception(std::make_exception_ptr(
            std::runtime_error("StdioTransport: cannot send " + notification->method)));
    }
    return future;
}

void StdioTransport::SetNotificationHandler(NotificationHandler handler) {
    pImpl->handlers.notificationHandler = std::move(handler);
}

void StdioTransport::SetRequestHandler(RequestHandler handler) {
    pImpl->handlers.requestHandler = std::move(handler);
}

void StdioTransport::SetErrorHandler(ErrorHandler handler) {
    pImpl->handlers.errorHandler = std::move(handler);
}

void StdioTransport::SetWriteQueueMaxBytes(std::size_t maxBytes) {
    std::lock_guard<std::mutex> lk(pImpl->writeMutex);
    pImpl->writeQueueMaxBytes = maxBytes;
}

} // namespace flagbridge
