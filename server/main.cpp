//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// Copyright (c) 2026 flagbridge contributors
// File: main.cpp
// Purpose: flagbridge-server entry point (stdio MCP server bridging to the Unleash Admin API)
//==========================================================================================================

#include <condition_variable>
#include <iostream>
#include <mutex>
#include <string>
#include <vector>

#include "env/EnvVars.h"
#include "flagbridge/Config.h"
#include "flagbridge/ExecutionContext.h"
#include "flagbridge/ProgressEmitter.h"
#include "flagbridge/Server.h"
#include "flagbridge/StdioTransport.hpp"
#include "flagbridge/ToolRegistry.h"
#include "flagbridge/UnleashClient.hpp"
#include "flagbridge/errors/Errors.h"
#include "flagbridge/resources/ResourceTemplates.h"
#include "flagbridge/resources/UnleashResources.h"
#include "flagbridge/tools/FlagTools.h"
#include "flagbridge/version.h"
#include "logging/Logger.h"

using namespace flagbridge;

namespace {

constexpr const char* kInstructions =
    "Use create_flag to add a feature flag, get_flag_state to inspect it and toggle_flag_environment "
    "to enable or disable it in one environment. Projects and flags can be browsed through the "
    "unleash:// resource templates. projectId and environment fall back to the configured defaults.";

// Blocks until the transport reports end of input or a fatal error.
class StopSignal {
public:
    void Raise(const std::string& reason) {
        {
            std::lock_guard<std::mutex> lk(mutex);
            if (raised) return;
            raised = true;
            why = reason;
        }
        cv.notify_all();
    }

    std::string Wait() {
        std::unique_lock<std::mutex> lk(mutex);
        cv.wait(lk, [this] { return raised; });
        return why;
    }

private:
    std::mutex mutex;
    std::condition_variable cv;
    bool raised{false};
    std::string why;
};

} // namespace

int main(int argc, char** argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i] ? argv[i] : "");
    }

    Config config;
    try {
        config = ConfigLoader(ConfigLoader::ProcessEnvironment()).Load(args);
    } catch (const ConfigError& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    auto logger = MakeLogger(config.logLevel, config.logFile, config.logColor);
    FLAGBRIDGE_LOG_INFO(*logger, "flagbridge {} starting (baseUrl={}, dryRun={})", getVersionString(),
                        config.remoteBaseUrl, config.dryRun);

    UnleashClient::Options clientOpts;
    clientOpts.baseUrl = config.remoteBaseUrl;
    clientOpts.accessToken = config.accessToken;
    clientOpts.dryRun = config.dryRun;
    clientOpts.caFile = GetEnvOrDefault("UNLEASH_CA_FILE", "");
    clientOpts.caPath = GetEnvOrDefault("UNLEASH_CA_PATH", "");

    ServerOptions serverOpts;
    serverOpts.version = getVersionString();
    serverOpts.instructions = kInstructions;
    Server server(serverOpts, logger);

    ServerBindings bindings;
    try {
        auto remote = std::make_shared<UnleashClient>(clientOpts, logger);
        auto progress = std::make_shared<const ProgressEmitter>(server.GetNotificationSender(), logger, "flagbridge");
        bindings.context = MakeExecutionContext(config, remote, logger, progress);

        auto registry = std::make_shared<ToolRegistry>();
        tools::RegisterFlagTools(*registry);
        bindings.tools = std::make_shared<const ToolDispatcher>(registry, bindings.context);

        auto router = std::make_shared<resources::ResourceRouter>();
        resources::RegisterUnleashResources(*router);
        bindings.resources = router;
    } catch (const errors::RegistrationConflictError& e) {
        FLAGBRIDGE_LOG_ERROR(*logger, "Registration failed: {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        FLAGBRIDGE_LOG_ERROR(*logger, "Startup failed: {}", e.what());
        return 1;
    }

    // The stdio reader thread raises this; Stop() must not run on that thread.
    StopSignal stop;
    server.SetErrorCallback([&stop](const std::string& err) { stop.Raise(err); });

    try {
        server.Start(std::make_unique<StdioTransport>(logger), bindings).get();
    } catch (const std::exception& e) {
        FLAGBRIDGE_LOG_ERROR(*logger, "Failed to start stdio transport: {}", e.what());
        return 1;
    }

    const std::string reason = stop.Wait();
    FLAGBRIDGE_LOG_INFO(*logger, "Server stopping: {}", reason);
    try {
        server.Stop().get();
    } catch (const std::exception& e) {
        FLAGBRIDGE_LOG_WARN(*logger, "Error while stopping: {}", e.what());
    }
    return 0;
}
