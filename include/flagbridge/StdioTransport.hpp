//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// Copyright (c) 2026 flagbridge contributors
// File: StdioTransport.hpp
// Purpose: Newline-delimited JSON-RPC transport over stdin/stdout
//==========================================================================================================
#pragma once

#include <cstddef>
#include <iosfwd>
#include <memory>

#include "flagbridge/Transport.h"

namespace flagbridge {

class Logger;

//==========================================================================================================
// StdioTransport
// Purpose: One JSON-RPC message per line. A reader thread parses input lines; a writer thread drains a
//          bounded queue to the output stream. The output stream carries protocol frames only.
// Notes:
//   - End of input reports "stdin closed" through the error handler and disconnects.
//   - Each request is handled on its own thread; responses and notifications share the writer queue.
//==========================================================================================================
class StdioTransport : public ITransport {
public:
    // in/out default to std::cin/std::cout; tests pass string streams.
    explicit StdioTransport(std::shared_ptr<Logger> logger = nullptr);
    StdioTransport(std::istream& in, std::ostream& out, std::shared_ptr<Logger> logger = nullptr);
    ~StdioTransport() override;

    ////////////////////////////////////////// ITransport //////////////////////////////////////////
    std::future<void> Start() override;

    //==========================================================================================================
    // Stops accepting input, waits for every dispatched request to be answered, then stops the writer
    // after flushing queued frames. Blocks while a handler runs, so it must not be called from inside one.
    //==========================================================================================================
    std::future<void> Close() override;

    bool IsConnected() const override;

    // The future carries std::runtime_error when disconnected or when the write queue is full.
    std::future<void> SendNotification(
        std::unique_ptr<JSONRPCNotification> notification) override;

    void SetNotificationHandler(NotificationHandler handler) override;
    void SetRequestHandler(RequestHandler handler) override;
    void SetErrorHandler(ErrorHandler handler) override;

    //==========================================================================================================
    // SetWriteQueueMaxBytes
    // Purpose: Backpressure clamp for pending output.
    // Args:
    //   maxBytes: Frames that would push the queue past this size are rejected (default 2 MiB).
    //==========================================================================================================
    void SetWriteQueueMaxBytes(std::size_t maxBytes);

private:
    class Impl;
    std::shared_ptr<Impl> pImpl;
};

} // namespace flagbridge
