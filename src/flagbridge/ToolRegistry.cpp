//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2026 flagbridge contributors
// File: ToolRegistry.cpp
// Purpose: Tool catalog and dispatch implementation
//==========================================================================================================

#include <stdexcept>

#include "flagbridge/ToolRegistry.h"
#include "flagbridge/errors/Errors.h"
#include "flagbridge/typed/Content.h"
#include "logging/Logger.h"

namespace flagbridge {

void ToolRegistry::Register(ToolDefinition definition) {
    if (definition.name.empty()) {
        throw std::invalid_argument("ToolRegistry: tool name must not be empty");
    }
    if (!definition.validator || !definition.handler) {
        throw std::invalid_argument("ToolRegistry: tool '" + definition.name + "' needs a validator and a handler");
    }
    if (tools.count(definition.name) > 0) {
        throw errors::RegistrationConflictError("Tool already registered: " + definition.name);
    }
    const std::string key = definition.name;
    tools.emplace(key, std::move(definition));
}

const ToolDefinition* ToolRegistry::Find(const std::string& name) const {
    auto it = tools.find(name);
    return it == tools.end() ? nullptr : &it->second;
}

std::vector<Tool> ToolRegistry::List() const {
    std::vector<Tool> out;
    out.reserve(tools.size());
    for (const auto& [name, def] : tools) {
        out.emplace_back(name, def.description, def.validator->SchemaJson());
    }
    return out;
}

ToolDispatcher::ToolDispatcher(std::shared_ptr<const ToolRegistry> registry,
                               std::shared_ptr<const ExecutionContext> context)
    : tools(std::move(registry)), context(std::move(context)) {
    if (!tools || !this->context) {
        throw std::invalid_argument("ToolDispatcher: registry and context are required");
    }
}

CallToolResult ToolDispatcher::Invoke(const std::string& name, const JSONValue& arguments,
                                      const std::optional<ProgressToken>& progressToken) const noexcept {
    try {
        const ToolDefinition* def = tools->Find(name);
        if (!def) {
            throw errors::NotFoundToolError(name);
        }

        auto parsed = def->validator->Parse(arguments);
        if (!parsed.ok()) {
            throw errors::InputValidationError(std::move(parsed.violations));
        }

        FLAGBRIDGE_LOG_DEBUG(context->logger(), "Invoking tool {}", name);
        auto fut = def->handler(*context, parsed.value.value(), progressToken);
        return fut.get();
    } catch (...) {
        // Non-std exceptions normalize to Unknown.
        return failure(name, std::current_exception());
    }
}

CallToolResult ToolDispatcher::failure(const std::string& name, std::exception_ptr error) const noexcept {
    const errors::NormalizedError normalized = errors::normalizeError(error);
    FLAGBRIDGE_LOG_ERROR(context->logger(), "Error in {}: [{}] {}", name,
                         errors::errorKindName(normalized.kind), normalized.message);

    CallToolResult result;
    result.isError = true;
    result.content.push_back(typed::makeText(errors::formatErrorText(normalized)));

    JSONValue::Object structured;
    structured["success"] = std::make_shared<JSONValue>(false);
    structured["error"] = std::make_shared<JSONValue>(errors::toJson(normalized));
    result.structuredContent = JSONValue{structured};
    return result;
}

} // namespace flagbridge
