//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2026 flagbridge contributors
// File: ToolRegistry.h
// Purpose: Named tool catalog and the dispatcher that validates, invokes and normalizes tool calls
//==========================================================================================================

#pragma once

#include <functional>
#include <future>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "flagbridge/ExecutionContext.h"
#include "flagbridge/ProgressEmitter.h"
#include "flagbridge/Protocol.h"
#include "flagbridge/validation/InputValidator.h"

namespace flagbridge {

// Tool body. args has already been validated against the tool's validator.
using ToolHandler = std::function<std::future<CallToolResult>(const ExecutionContext& ctx,
                                                              const JSONValue& args,
                                                              const std::optional<ProgressToken>& progressToken)>;

//==========================================================================================================
// ToolDefinition
// Purpose: Everything needed to advertise and run one tool.
//==========================================================================================================
struct ToolDefinition {
    std::string name;
    std::string description;
    std::shared_ptr<const validation::IInputValidator> validator;
    ToolHandler handler;
};

//==========================================================================================================
// ToolRegistry
// Purpose: Catalog populated once at startup, read-only afterwards.
// Notes:
//   - Register throws errors::RegistrationConflictError on a duplicate name.
//   - List is ordered by tool name.
//==========================================================================================================
class ToolRegistry {
public:
    void Register(ToolDefinition definition);

    // nullptr when no tool has that name.
    const ToolDefinition* Find(const std::string& name) const;

    std::vector<Tool> List() const;

    std::size_t Size() const { return tools.size(); }

private:
    std::map<std::string, ToolDefinition> tools;
};

//==========================================================================================================
// ToolDispatcher
// Purpose: Single entry point for tools/call. Every failure, including unknown tools and invalid
//          arguments, comes back as an isError CallToolResult; Invoke never throws.
//==========================================================================================================
class ToolDispatcher {
public:
    ToolDispatcher(std::shared_ptr<const ToolRegistry> registry, std::shared_ptr<const ExecutionContext> context);

    //==========================================================================================================
    // Runs one tool call to completion.
    // Args:
    //   name: Tool name from tools/call.
    //   arguments: Raw arguments (null when the caller sent none).
    //   progressToken: Caller token from params._meta, if any.
    // Returns:
    //   The tool's result, or an isError result with "Error: ..." text and structuredContent
    //   {success:false, error:{code, message, hint?}}. Exactly one error log line per failure.
    //==========================================================================================================
    CallToolResult Invoke(const std::string& name, const JSONValue& arguments,
                          const std::optional<ProgressToken>& progressToken) const noexcept;

    const ToolRegistry& registry() const { return *tools; }

private:
    CallToolResult failure(const std::string& name, std::exception_ptr error) const noexcept;

    std::shared_ptr<const ToolRegistry> tools;
    std::shared_ptr<const ExecutionContext> context;
};

} // namespace flagbridge
