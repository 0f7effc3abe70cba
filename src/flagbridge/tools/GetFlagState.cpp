//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2026 flagbridge contributors
// File: GetFlagState.cpp
// Purpose: get_flag_state tool: feature metadata and per-environment strategy summary
//==========================================================================================================

#include <format>

#include "flagbridge/ExecutionContext.h"
#include "flagbridge/async/FutureAwaitable.h"
#include "flagbridge/async/Task.h"
#include "flagbridge/tools/FlagTools.h"
#include "flagbridge/typed/Content.h"

namespace flagbridge {
namespace tools {

namespace {
constexpr const char* kBullet = " \xE2\x80\xA2 ";

std::size_t arraySize(const JSONValue& obj, const char* key) {
    const JSONValue* v = obj.find(key);
    return v && v->isArray() ? std::get<JSONValue::Array>(v->value).size() : 0;
}

// "<env>: enabled (1/2 active strategies, 3 variants)"
std::string summarizeEnvironment(const JSONValue& env) {
    const bool enabled = GetBoolField(env, "enabled").value_or(false);
    std::size_t strategies = 0;
    std::size_t active = 0;
    if (const JSONValue* list = env.find("strategies"); list && list->isArray()) {
        for (const auto& s : std::get<JSONValue::Array>(list->value)) {
            ++strategies;
            if (!s || !GetBoolField(*s, "disabled").value_or(false)) ++active;
        }
    }
    const std::size_t variants = arraySize(env, "variants");
    const std::string name = GetStringField(env, "environment").value_or(GetStringField(env, "name").value_or("unknown"));
    std::string out = std::format("{}: {} ({}/{} active strategies", name, enabled ? "enabled" : "disabled",
                                  active, strategies);
    if (variants > 0) {
        out += std::format(", {} variants", variants);
    }
    out += ")";
    return out;
}

async::Task<CallToolResult> getFlagState(const ExecutionContext& ctx, JSONValue args,
                                         std::optional<ProgressToken> token) {
    const std::string featureName = GetStringField(args, "featureName").value();
    const auto environmentFilter = GetStringField(args, "environment");
    const std::string projectId = ctx.ResolveProjectId(GetStringField(args, "projectId"));

    ctx.progress().Notify(token, 0, 100,
                          std::format("Fetching feature \"{}\" in project \"{}\"...", featureName, projectId));

    JSONValue feature = co_await async::makeFutureAwaitable(ctx.remote().FetchFeature(projectId, featureName));

    JSONValue::Array environments;
    if (const JSONValue* envs = feature.find("environments"); envs && envs->isArray()) {
        for (const auto& env : std::get<JSONValue::Array>(envs->value)) {
            if (!env) continue;
            if (environmentFilter.has_value() && !environmentFilter->empty() &&
                !EnvironmentMatches(*env, environmentFilter.value())) {
                continue;
            }
            environments.push_back(env);
        }
    }

    ctx.progress().Notify(token, 100, 100,
                          std::format("Fetched feature \"{}\" ({} environment{} considered)", featureName,
                                      environments.size(), environments.size() == 1 ? "" : "s"));

    const std::string flagName = GetStringField(feature, "name").value_or(featureName);
    const auto link = CreateFlagResourceLink(ctx.config().remoteBaseUrl, projectId, featureName);
    const std::string apiUrl = FeatureApiUrl(ctx.config().remoteBaseUrl, projectId, featureName);

    std::string summaries;
    if (environments.empty()) {
        summaries = "- No environments matched the provided filters.";
    }
    for (const auto& env : environments) {
        if (!summaries.empty()) summaries += "\n";
        summaries += "- " + summarizeEnvironment(*env);
    }

    std::string text;
    text += std::format("Feature \"{}\" ({})\n", flagName, GetStringField(feature, "type").value_or("unknown type"));
    text += std::string("Enabled: ") + (GetBoolField(feature, "enabled").value_or(false) ? "yes" : "no") + kBullet +
            "Archived: " + (GetBoolField(feature, "archived").value_or(false) ? "yes" : "no") + kBullet +
            "Impression data: " + (GetBoolField(feature, "impressionData").value_or(false) ? "on" : "off") + "\n";
    text += "Project: " + GetStringField(feature, "project").value_or(projectId) + "\n";
    text += "Environments:\n" + summaries + "\n";
    text += "View feature: " + link.url + "\n";
    text += "Admin API: " + apiUrl;

    if (environmentFilter.has_value()) {
        FLAGBRIDGE_LOG_INFO(ctx.logger(), "Retrieved feature state for \"{}\" (filtered to \"{}\")", featureName,
                            environmentFilter.value());
    } else {
        FLAGBRIDGE_LOG_INFO(ctx.logger(), "Retrieved feature state for \"{}\"", featureName);
    }

    JSONValue::Object links;
    links["ui"] = std::make_shared<JSONValue>(link.url);
    links["api"] = std::make_shared<JSONValue>(apiUrl);
    links["resourceUri"] = std::make_shared<JSONValue>(link.resource.uri);

    JSONValue::Object structured;
    structured["success"] = std::make_shared<JSONValue>(true);
    structured["projectId"] = std::make_shared<JSONValue>(projectId);
    structured["featureName"] = std::make_shared<JSONValue>(flagName);
    if (environmentFilter.has_value()) {
        structured["environmentFilter"] = std::make_shared<JSONValue>(environmentFilter.value());
    }
    structured["feature"] = std::make_shared<JSONValue>(feature);
    structured["environments"] = std::make_shared<JSONValue>(std::move(environments));
    structured["links"] = std::make_shared<JSONValue>(std::move(links));

    CallToolResult result;
    result.content.push_back(typed::makeText(text));
    result.content.push_back(typed::makeEmbeddedResource(link.resource));
    result.structuredContent = JSONValue{std::move(structured)};
    co_return result;
}
} // namespace

ToolDefinition MakeGetFlagStateTool() {
    auto schema = std::make_shared<validation::ObjectSchema>();
    schema->String("projectId", "Project ID where the feature flag resides (optional if UNLEASH_DEFAULT_PROJECT is set)")
        .String("featureName", "Feature flag name", true, 1)
        .String("environment", "Optional environment filter (case-insensitive)");

    ToolDefinition def;
    def.name = GET_FLAG_STATE;
    def.description = "Fetch the current feature flag metadata and environment strategies from the Unleash Admin API.";
    def.validator = schema;
    def.handler = [](const ExecutionContext& ctx, const JSONValue& args, const std::optional<ProgressToken>& token) {
        return getFlagState(ctx, args, token).toFuture();
    };
    return def;
}

} // namespace tools
} // namespace flagbridge
