//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2026 flagbridge contributors
// File: ExecutionContext.h
// Purpose: Immutable handle composing configuration and collaborators for every tool and resource read
//==========================================================================================================

#pragma once

#include <memory>
#include <optional>
#include <string>

#include "flagbridge/Config.h"
#include "flagbridge/ProgressEmitter.h"
#include "flagbridge/RemoteClient.h"
#include "logging/Logger.h"

namespace flagbridge {

//==========================================================================================================
// ExecutionContext
// Purpose: Single composition point built once after configuration succeeds and before the transport
//          starts. Shared read-only across concurrent invocations; members are never reassigned.
//==========================================================================================================
class ExecutionContext {
public:
    ExecutionContext(Config config,
                     std::shared_ptr<IRemoteClient> remoteClient,
                     std::shared_ptr<Logger> logger,
                     std::shared_ptr<const ProgressEmitter> progress);

    ExecutionContext(const ExecutionContext&) = delete;
    ExecutionContext& operator=(const ExecutionContext&) = delete;

    const Config& config() const { return cfg; }
    IRemoteClient& remote() const { return *remoteClient; }
    Logger& logger() const { return *log; }
    const ProgressEmitter& progress() const { return *emitter; }

    // Returns provided when non-empty, else the configured default project.
    // Throws errors::MissingConfigurationError naming UNLEASH_DEFAULT_PROJECT.
    std::string ResolveProjectId(const std::optional<std::string>& provided) const;

    // Same fallback for environments (UNLEASH_DEFAULT_ENVIRONMENT).
    std::string ResolveEnvironment(const std::optional<std::string>& provided) const;

private:
    const Config cfg;
    const std::shared_ptr<IRemoteClient> remoteClient;
    const std::shared_ptr<Logger> log;
    const std::shared_ptr<const ProgressEmitter> emitter;
};

//==========================================================================================================
// MakeExecutionContext
// Purpose: Validates collaborators and builds the shared context.
// Returns:
//   shared_ptr<const ExecutionContext>. Throws std::invalid_argument when a collaborator is missing.
//==========================================================================================================
std::shared_ptr<const ExecutionContext> MakeExecutionContext(Config config,
                                                             std::shared_ptr<IRemoteClient> remoteClient,
                                                             std::shared_ptr<Logger> logger,
                                                             std::shared_ptr<const ProgressEmitter> progress);

} // namespace flagbridge
