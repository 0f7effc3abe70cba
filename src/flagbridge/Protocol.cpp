//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// Copyright (c) 2026 flagbridge contributors
// File: Protocol.cpp
// Purpose: JSON serialization of protocol structures
//==========================================================================================================

#include "flagbridge/Protocol.h"

namespace flagbridge {

JSONValue toJson(const Tool& tool) {
    JSONValue::Object obj;
    obj["name"] = std::make_shared<JSONValue>(tool.name);
    obj["description"] = std::make_shared<JSONValue>(tool.description);
    if (tool.inputSchema.isObject()) {
        obj["inputSchema"] = std::make_shared<JSONValue>(tool.inputSchema);
    } else {
        JSONValue::Object schema;
        schema["type"] = std::make_shared<JSONValue>(std::string("object"));
        obj["inputSchema"] = std::make_shared<JSONValue>(schema);
    }
    return JSONValue{obj};
}

JSONValue toJson(const CallToolResult& result) {
    JSONValue::Object obj;
    JSONValue::Array content;
    for (const auto& item : result.content) {
        content.push_back(std::make_shared<JSONValue>(item));
    }
    obj["content"] = std::make_shared<JSONValue>(content);
    obj["isError"] = std::make_shared<JSONValue>(result.isError);
    if (result.structuredContent.has_value()) {
        obj["structuredContent"] = std::make_shared<JSONValue>(result.structuredContent.value());
    }
    return JSONValue{obj};
}

JSONValue toJson(const ResourceTemplate& tmpl) {
    JSONValue::Object obj;
    obj["uriTemplate"] = std::make_shared<JSONValue>(tmpl.uriTemplate);
    obj["name"] = std::make_shared<JSONValue>(tmpl.name);
    if (tmpl.description.has_value()) {
        obj["description"] = std::make_shared<JSONValue>(tmpl.description.value());
    }
    if (tmpl.mimeType.has_value()) {
        obj["mimeType"] = std::make_shared<JSONValue>(tmpl.mimeType.value());
    }
    return JSONValue{obj};
}

JSONValue toJson(const ResourceContent& content) {
    JSONValue::Object obj;
    obj["uri"] = std::make_shared<JSONValue>(content.uri);
    obj["mimeType"] = std::make_shared<JSONValue>(content.mimeType);
    obj["text"] = std::make_shared<JSONValue>(content.text);
    return JSONValue{obj};
}

JSONValue toJson(const ReadResourceResult& result) {
    JSONValue::Object obj;
    JSONValue::Array contents;
    for (const auto& c : result.contents) {
        contents.push_back(std::make_shared<JSONValue>(toJson(c)));
    }
    obj["contents"] = std::make_shared<JSONValue>(contents);
    return JSONValue{obj};
}

} // namespace flagbridge
