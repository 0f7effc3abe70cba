//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2026 flagbridge contributors
// File: ExecutionContext.cpp
// Purpose: Execution context assembly
//==========================================================================================================

#include <stdexcept>

#include "flagbridge/ExecutionContext.h"
#include "flagbridge/errors/Errors.h"

namespace flagbridge {

namespace {
template <typename T>
std::shared_ptr<T> required(std::shared_ptr<T> p, const char* what) {
    if (!p) {
        throw std::invalid_argument(std::string("ExecutionContext: missing ") + what);
    }
    return p;
}

std::string resolveOrThrow(const std::optional<std::string>& provided, const std::optional<std::string>& fallback,
                           const char* what, const char* knob) {
    if (provided.has_value() && !provided->empty()) {
        return provided.value();
    }
    if (fallback.has_value() && !fallback->empty()) {
        return fallback.value();
    }
    throw errors::MissingConfigurationError(what, knob);
}
} // namespace

ExecutionContext::ExecutionContext(Config config,
                                   std::shared_ptr<IRemoteClient> remoteClient,
                                   std::shared_ptr<Logger> logger,
                                   std::shared_ptr<const ProgressEmitter> progress)
    : cfg(std::move(config)),
      remoteClient(required(std::move(remoteClient), "remote client")),
      log(required(std::move(logger), "logger")),
      emitter(required(std::move(progress), "progress emitter")) {}

std::string ExecutionContext::ResolveProjectId(const std::optional<std::string>& provided) const {
    return resolveOrThrow(provided, cfg.defaultProject, "Project ID", "UNLEASH_DEFAULT_PROJECT");
}

std::string ExecutionContext::ResolveEnvironment(const std::optional<std::string>& provided) const {
    return resolveOrThrow(provided, cfg.defaultEnvironment, "Environment", "UNLEASH_DEFAULT_ENVIRONMENT");
}

std::shared_ptr<const ExecutionContext> MakeExecutionContext(Config config,
                                                             std::shared_ptr<IRemoteClient> remoteClient,
                                                             std::shared_ptr<Logger> logger,
                                                             std::shared_ptr<const ProgressEmitter> progress) {
    auto ctx = std::make_shared<const ExecutionContext>(std::move(config), std::move(remoteClient),
                                                        std::move(logger), std::move(progress));
    FLAGBRIDGE_LOG_DEBUG(ctx->logger(), "Execution context ready (baseUrl={}, dryRun={})",
                         ctx->config().remoteBaseUrl, ctx->config().dryRun);
    return ctx;
}

} // namespace flagbridge
