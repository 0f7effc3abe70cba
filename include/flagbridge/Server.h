//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// Copyright (c) 2026 flagbridge contributors
// File: Server.h
// Purpose: MCP server loop binding a transport to the tool dispatcher and the resource router
//==========================================================================================================

#pragma once

#include <functional>
#include <future>
#include <memory>
#include <string>

#include "flagbridge/ProgressEmitter.h"
#include "flagbridge/Transport.h"

namespace flagbridge {

class ExecutionContext;
class Logger;
class ToolDispatcher;

namespace resources {
class ResourceRouter;
}

//==========================================================================================================
// ServerOptions
// Fields:
//   name/version: serverInfo reported by initialize
//   instructions: Usage guidance returned to the agent by initialize
//==========================================================================================================
struct ServerOptions {
    std::string name{"flagbridge"};
    std::string version;
    std::string instructions;
};

// Collaborators answering requests. All three are required.
struct ServerBindings {
    std::shared_ptr<const ExecutionContext> context;
    std::shared_ptr<const ToolDispatcher> tools;
    std::shared_ptr<const resources::ResourceRouter> resources;
};

//==========================================================================================================
// Server
// Purpose: Handles initialize, ping, tools/list, tools/call, resources/templates/list, resources/list,
//          resources/read and logging/setLevel over one transport.
// Notes:
//   - Tool failures come back as isError results; resource failures as JSON-RPC errors carrying the
//     normalized kind in error.data.
//   - GetNotificationSender() may be taken before Start(); sends fail while no transport is connected.
//==========================================================================================================
class Server {
public:
    Server(ServerOptions options, std::shared_ptr<Logger> logger);
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    // Sender routing notifications to the connected transport (used to build the ProgressEmitter).
    NotificationSender GetNotificationSender();

    //==========================================================================================================
    // Wires the transport handlers and starts the transport.
    // Args:
    //   transport: Transport owned by the server from now on.
    //   bindings: Context, dispatcher and router.
    // Returns:
    //   Future that completes when the transport is running. Throws std::invalid_argument on a missing
    //   binding or transport.
    //==========================================================================================================
    std::future<void> Start(std::unique_ptr<ITransport> transport, ServerBindings bindings);

    // Closes the transport; returns after any tools/call or resources/read still running has answered.
    // Must not be called from a tool, reader or transport callback.
    std::future<void> Stop();

    bool IsRunning() const;

    // Invoked for transport errors, including end of input on stdio.
    using ErrorCallback = std::function<void(const std::string& error)>;
    void SetErrorCallback(ErrorCallback callback);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace flagbridge
