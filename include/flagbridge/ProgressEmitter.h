//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2026 flagbridge contributors
// File: ProgressEmitter.h
// Purpose: Best-effort progress notifications correlated with one tool invocation by a caller token
//==========================================================================================================

#pragma once

#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <variant>

#include "flagbridge/JSONRPCTypes.h"

namespace flagbridge {

class Logger;

// Opaque caller-supplied token (MCP allows string or integer).
using ProgressToken = std::variant<std::string, int64_t>;

JSONValue progressTokenToJson(const ProgressToken& token);

// Reads params._meta.progressToken; std::nullopt when absent or of an unsupported type.
std::optional<ProgressToken> progressTokenFromParams(const JSONValue& params);

// Hands a notification to the protocol layer. The returned future may carry a send failure.
using NotificationSender = std::function<std::future<void>(std::unique_ptr<JSONRPCNotification>)>;

//==========================================================================================================
// ProgressEmitter
// Purpose: Emits notifications/progress and, optionally, notifications/message for a token.
// Notes:
//   - Without a token Notify returns immediately and the sender is never called.
//   - Within one Notify call the progress notification is sent before the status message.
//   - Send failures are logged at DEBUG and discarded; Notify never throws.
//   - Monotonic progress within an invocation is the caller's responsibility.
//==========================================================================================================
class ProgressEmitter {
public:
    ProgressEmitter(NotificationSender sender, std::shared_ptr<Logger> logger,
                    std::string loggerName = "flagbridge");

    void Notify(const std::optional<ProgressToken>& token, double progress, double total,
                const std::optional<std::string>& message = std::nullopt) const noexcept;

private:
    void send(std::unique_ptr<JSONRPCNotification> notification) const noexcept;

    NotificationSender sender;
    std::shared_ptr<Logger> logger;
    std::string loggerName;
};

} // namespace flagbridge
