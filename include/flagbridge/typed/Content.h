//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// Copyright (c) 2026 flagbridge contributors
// File: Content.h
// Purpose: Helpers for constructing and extracting typed content items of tool results
//==========================================================================================================

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "flagbridge/Protocol.h"

namespace flagbridge {
namespace typed {

//------------------------------ Builders ------------------------------
inline JSONValue makeText(const std::string& text) {
    JSONValue::Object obj;
    obj["type"] = std::make_shared<JSONValue>(std::string("text"));
    obj["text"] = std::make_shared<JSONValue>(text);
    return JSONValue{obj};
}

// Embedded resource: { type: "resource", resource: { uri, mimeType, text } }
inline JSONValue makeEmbeddedResource(const ResourceContent& resource) {
    JSONValue::Object obj;
    obj["type"] = std::make_shared<JSONValue>(std::string("resource"));
    obj["resource"] = std::make_shared<JSONValue>(toJson(resource));
    return JSONValue{obj};
}

// Resource link: { type: "resource_link", name, uri, mimeType, title }
inline JSONValue makeResourceLink(const std::string& name, const ResourceContent& resource) {
    JSONValue::Object obj;
    obj["type"] = std::make_shared<JSONValue>(std::string("resource_link"));
    obj["name"] = std::make_shared<JSONValue>(name);
    obj["uri"] = std::make_shared<JSONValue>(resource.uri);
    obj["mimeType"] = std::make_shared<JSONValue>(resource.mimeType);
    obj["title"] = std::make_shared<JSONValue>(resource.text);
    return JSONValue{obj};
}

//------------------------------ Inspectors ------------------------------
inline std::optional<std::string> contentType(const JSONValue& v) {
    return GetStringField(v, "type");
}

inline bool isText(const JSONValue& v) {
    auto t = contentType(v);
    return t.has_value() && t.value() == "text";
}

inline std::optional<std::string> getText(const JSONValue& v) {
    if (!isText(v)) return std::nullopt;
    return GetStringField(v, "text");
}

inline std::vector<std::string> collectText(const CallToolResult& r) {
    std::vector<std::string> out;
    out.reserve(r.content.size());
    for (const auto& v : r.content) {
        auto t = getText(v);
        if (t.has_value()) out.push_back(t.value());
    }
    return out;
}

inline std::optional<std::string> firstText(const CallToolResult& r) {
    auto v = collectText(r);
    if (v.empty()) return std::nullopt;
    return v.front();
}

// First content item of the given type, if any.
inline const JSONValue* findContent(const CallToolResult& r, const std::string& type) {
    for (const auto& v : r.content) {
        auto t = contentType(v);
        if (t.has_value() && t.value() == type) return &v;
    }
    return nullptr;
}

} // namespace typed
} // namespace flagbridge
