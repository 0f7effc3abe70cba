//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2026 flagbridge contributors
// File: FlagTools.h
// Purpose: Feature flag tools (create_flag, get_flag_state, toggle_flag_environment) and shared helpers
//==========================================================================================================

#pragma once

#include <string>

#include "flagbridge/Protocol.h"
#include "flagbridge/ToolRegistry.h"

namespace flagbridge {
namespace tools {

constexpr const char* CREATE_FLAG = "create_flag";
constexpr const char* GET_FLAG_STATE = "get_flag_state";
constexpr const char* TOGGLE_FLAG_ENVIRONMENT = "toggle_flag_environment";

// Flag types accepted by the Unleash Admin API.
inline const std::vector<std::string>& FlagTypes() {
    static const std::vector<std::string> types{"release", "experiment", "operational", "kill-switch", "permission"};
    return types;
}

//==========================================================================================================
// FlagResourceLink
// Purpose: Admin UI URL plus the resource reference pointing at the single-flag template.
// Fields:
//   url: <baseUrl>/projects/<p>/features/<f> with duplicate path slashes collapsed
//   resource: {uri: unleash://projects/<p>/feature-flags/<f>, mimeType: application/json,
//              text: "Feature flag: <f>"}
//==========================================================================================================
struct FlagResourceLink {
    std::string url;
    ResourceContent resource;
};

FlagResourceLink CreateFlagResourceLink(const std::string& baseUrl, const std::string& projectId,
                                        const std::string& flagName);

// Collapses repeated '/' in the path part of url, leaving "scheme://" intact.
std::string CollapseDuplicateSlashes(const std::string& url);

// <baseUrl>/api/admin/projects/<p>/features/<f> with encoded segments.
std::string FeatureApiUrl(const std::string& baseUrl, const std::string& projectId, const std::string& featureName);

// True when env's "environment" or "name" equals name (case-insensitive).
bool EnvironmentMatches(const JSONValue& env, const std::string& name);

// First environment entry of feature matching name; nullptr when none does.
const JSONValue* FindEnvironment(const JSONValue& feature, const std::string& name);

// Tool definitions; each carries its own input schema.
ToolDefinition MakeCreateFlagTool();
ToolDefinition MakeGetFlagStateTool();
ToolDefinition MakeToggleFlagEnvironmentTool();

// Registers all flag tools. Throws errors::RegistrationConflictError when one is already present.
void RegisterFlagTools(ToolRegistry& registry);

} // namespace tools
} // namespace flagbridge
