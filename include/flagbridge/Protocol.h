//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// Copyright (c) 2026 flagbridge contributors
// File: Protocol.h
// Purpose: MCP protocol data structures and constants used by the flag bridge
//==========================================================================================================

#pragma once

#include "flagbridge/JSONRPCTypes.h"
#include <optional>
#include <string>
#include <vector>

namespace flagbridge {

///////////////////////////////////////// Protocol constants ///////////////////////////////////////////
constexpr const char* PROTOCOL_VERSION = "2025-06-18";

// MIME type of every resource body and resource link produced by the bridge.
constexpr const char* JSON_MIME_TYPE = "application/json";

///////////////////////////////////////// Implementation ///////////////////////////////////////////
struct Implementation {
    std::string name;
    std::string version;

    Implementation() = default;
    Implementation(std::string name, std::string version)
        : name(std::move(name)), version(std::move(version)) {}
};

///////////////////////////////////////// Tools ///////////////////////////////////////////
// Tool metadata as listed by tools/list.
struct Tool {
    std::string name;
    std::string description;
    JSONValue inputSchema;  // JSON Schema for tool parameters

    Tool() = default;
    Tool(std::string name, std::string description, JSONValue inputSchema = JSONValue{})
        : name(std::move(name)), description(std::move(description)), inputSchema(std::move(inputSchema)) {}
};

// Tool call result. isError results still carry content (the agent-facing error text).
struct CallToolResult {
    std::vector<JSONValue> content;  // Array of content items
    bool isError = false;
    std::optional<JSONValue> structuredContent;
};

///////////////////////////////////////// Resources ///////////////////////////////////////////
struct ResourceTemplate {
    std::string uriTemplate;
    std::string name;
    std::optional<std::string> description;
    std::optional<std::string> mimeType;

    ResourceTemplate() = default;
    ResourceTemplate(std::string uriTemplate, std::string name,
                     std::optional<std::string> description = std::nullopt,
                     std::optional<std::string> mimeType = std::nullopt)
        : uriTemplate(std::move(uriTemplate)), name(std::move(name)),
          description(std::move(description)), mimeType(std::move(mimeType)) {}
};

// One content block of a resources/read result.
struct ResourceContent {
    std::string uri;
    std::string mimeType;
    std::string text;
};

struct ReadResourceResult {
    std::vector<ResourceContent> contents;
};

///////////////////////////////////////// Serialization ///////////////////////////////////////////
JSONValue toJson(const Tool& tool);
JSONValue toJson(const CallToolResult& result);
JSONValue toJson(const ResourceTemplate& tmpl);
JSONValue toJson(const ResourceContent& content);
JSONValue toJson(const ReadResourceResult& result);

///////////////////////////////////////// Method names ///////////////////////////////////////////
namespace Methods {
    // Client to server
    constexpr const char* Initialize = "initialize";
    constexpr const char* Ping = "ping";
    constexpr const char* ListTools = "tools/list";
    constexpr const char* CallTool = "tools/call";
    constexpr const char* ReadResource = "resources/read";
    constexpr const char* ListResources = "resources/list";
    constexpr const char* ListResourceTemplates = "resources/templates/list";
    constexpr const char* SetLogLevel = "logging/setLevel";

    // Notifications
    constexpr const char* Initialized = "notifications/initialized";
    constexpr const char* Progress = "notifications/progress";
    constexpr const char* Log = "notifications/message";
    constexpr const char* Cancelled = "notifications/cancelled";
}

} // namespace flagbridge
