//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2026 flagbridge contributors
// File: ProgressEmitter.cpp
// Purpose: Progress notification emitter implementation
//==========================================================================================================

#include <cmath>

#include "logging/Logger.h"
#include "flagbridge/Protocol.h"
#include "flagbridge/ProgressEmitter.h"

namespace flagbridge {

namespace {
// Whole numbers go on the wire as integers ("progress":100, not 100.0).
JSONValue numberToJson(double v) {
    double integral = 0.0;
    if (std::modf(v, &integral) == 0.0 && std::fabs(integral) < 9.0e15) {
        return JSONValue(static_cast<int64_t>(integral));
    }
    return JSONValue(v);
}
} // namespace

JSONValue progressTokenToJson(const ProgressToken& token) {
    return std::visit([](const auto& v) { return JSONValue(v); }, token);
}

std::optional<ProgressToken> progressTokenFromParams(const JSONValue& params) {
    const JSONValue* meta = params.find("_meta");
    if (!meta) return std::nullopt;
    const JSONValue* raw = meta->find("progressToken");
    if (!raw) return std::nullopt;
    if (std::holds_alternative<std::string>(raw->value)) return ProgressToken{std::get<std::string>(raw->value)};
    if (std::holds_alternative<int64_t>(raw->value)) return ProgressToken{std::get<int64_t>(raw->value)};
    return std::nullopt;
}

ProgressEmitter::ProgressEmitter(NotificationSender sender, std::shared_ptr<Logger> logger, std::string loggerName)
    : sender(std::move(sender)), logger(logger ? std::move(logger) : MakeNullLogger()), loggerName(std::move(loggerName)) {}

void ProgressEmitter::Notify(const std::optional<ProgressToken>& token, double progress, double total,
                             const std::optional<std::string>& message) const noexcept {
    if (!token.has_value()) {
        return;
    }

    JSONValue::Object progressParams;
    progressParams["progressToken"] = std::make_shared<JSONValue>(progressTokenToJson(token.value()));
    progressParams["progress"] = std::make_shared<JSONValue>(numberToJson(progress));
    progressParams["total"] = std::make_shared<JSONValue>(numberToJson(total));
    send(std::make_unique<JSONRPCNotification>(Methods::Progress, JSONValue{progressParams}));

    if (message.has_value()) {
        JSONValue::Object logParams;
        logParams["level"] = std::make_shared<JSONValue>(std::string("info"));
        logParams["logger"] = std::make_shared<JSONValue>(loggerName);
        logParams["data"] = std::make_shared<JSONValue>(message.value());
        send(std::make_unique<JSONRPCNotification>(Methods::Log, JSONValue{logParams}));
    }
}

void ProgressEmitter::send(std::unique_ptr<JSONRPCNotification> notification) const noexcept {
    if (!sender) {
        return;
    }
    const std::string method = notification->method;
    try {
        auto fut = sender(std::move(notification));
        if (fut.valid()) {
            fut.get();
        }
    } catch (const std::exception& e) {
        FLAGBRIDGE_LOG_DEBUG(*logger, "Dropped {} notification: {}", method, e.what());
    } catch (...) {
        FLAGBRIDGE_LOG_DEBUG(*logger, "Dropped {} notification: unknown error", method);
    }
}

} // namespace flagbridge
