//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2026 flagbridge contributors
// File: FlagTools.cpp
// Purpose: Shared helpers for the flag tools and their registration
//==========================================================================================================

#include <algorithm>
#include <cctype>

#include "flagbridge/resources/QueryOptions.h"
#include "flagbridge/resources/ResourceTemplates.h"
#include "flagbridge/tools/FlagTools.h"

namespace flagbridge {
namespace tools {

namespace {
std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}
} // namespace

std::string CollapseDuplicateSlashes(const std::string& url) {
    std::size_t start = 0;
    auto schemeEnd = url.find("://");
    if (schemeEnd != std::string::npos) {
        start = schemeEnd + 3;
    }
    std::string out = url.substr(0, start);
    out.reserve(url.size());
    for (std::size_t i = start; i < url.size(); ++i) {
        if (url[i] == '?' || url[i] == '#') {
            out.append(url, i, std::string::npos);
            break;
        }
        if (url[i] == '/' && out.size() > start && out.back() == '/') {
            continue;
        }
        out.push_back(url[i]);
    }
    return out;
}

FlagResourceLink CreateFlagResourceLink(const std::string& baseUrl, const std::string& projectId,
                                        const std::string& flagName) {
    FlagResourceLink link;
    link.url = CollapseDuplicateSlashes(baseUrl + "/projects/" + projectId + "/features/" + flagName);
    link.resource.uri = resources::BuildFeatureFlagUri(projectId, flagName);
    link.resource.mimeType = JSON_MIME_TYPE;
    link.resource.text = "Feature flag: " + flagName;
    return link;
}

std::string FeatureApiUrl(const std::string& baseUrl, const std::string& projectId, const std::string& featureName) {
    return baseUrl + "/api/admin/projects/" + resources::percentEncode(projectId) + "/features/" +
           resources::percentEncode(featureName);
}

bool EnvironmentMatches(const JSONValue& env, const std::string& name) {
    const std::string target = lower(name);
    auto envName = GetStringField(env, "environment");
    auto plainName = GetStringField(env, "name");
    return (envName && lower(*envName) == target) || (plainName && lower(*plainName) == target);
}

const JSONValue* FindEnvironment(const JSONValue& feature, const std::string& name) {
    const JSONValue* envs = feature.find("environments");
    if (!envs || !envs->isArray()) {
        return nullptr;
    }
    for (const auto& env : std::get<JSONValue::Array>(envs->value)) {
        if (env && EnvironmentMatches(*env, name)) {
            return env.get();
        }
    }
    return nullptr;
}

void RegisterFlagTools(ToolRegistry& registry) {
    registry.Register(MakeCreateFlagTool());
    registry.Register(MakeGetFlagStateTool());
    registry.Register(MakeToggleFlagEnvironmentTool());
}

} // namespace tools
} // namespace flagbridge
