//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2026 flagbridge contributors
// File: ToggleFlagEnvironment.cpp
// Purpose: toggle_flag_environment tool
//==========================================================================================================

#include <format>

#include "flagbridge/ExecutionContext.h"
#include "flagbridge/async/FutureAwaitable.h"
#include "flagbridge/async/Task.h"
#include "flagbridge/resources/QueryOptions.h"
#include "flagbridge/tools/FlagTools.h"
#include "flagbridge/typed/Content.h"

namespace flagbridge {
namespace tools {

namespace {
constexpr const char* kBullet = " \xE2\x80\xA2 ";

async::Task<CallToolResult> toggleFlagEnvironment(const ExecutionContext& ctx, JSONValue args,
                                                  std::optional<ProgressToken> token) {
    const std::string featureName = GetStringField(args, "featureName").value();
    const bool enabled = GetBoolField(args, "enabled").value();
    const std::string projectId = ctx.ResolveProjectId(GetStringField(args, "projectId"));
    const std::string environment = ctx.ResolveEnvironment(GetStringField(args, "environment"));

    ctx.progress().Notify(token, 0, 100,
                          std::format("{} \"{}\" in \"{}\"...", enabled ? "Enabling" : "Disabling", featureName,
                                      environment));

    JSONValue feature = co_await async::makeFutureAwaitable(
        ctx.remote().ToggleFeatureEnvironment(projectId, featureName, environment, enabled));

    const std::string done = std::format("{} \"{}\" in \"{}\"", enabled ? "Enabled" : "Disabled", featureName,
                                         environment);
    ctx.progress().Notify(token, 100, 100, done);

    const std::string flagName = GetStringField(feature, "name").value_or(featureName);
    const auto link = CreateFlagResourceLink(ctx.config().remoteBaseUrl, projectId, featureName);
    const std::string apiUrl = FeatureApiUrl(ctx.config().remoteBaseUrl, projectId, featureName) +
                               "/environments/" + resources::percentEncode(environment) + (enabled ? "/on" : "/off");

    const JSONValue* state = FindEnvironment(feature, environment);
    std::string stateLine = "Environment state could not be located in the response.";
    bool effective = enabled;
    if (state) {
        effective = GetBoolField(*state, "enabled").value_or(enabled);
        std::size_t strategies = 0;
        if (const JSONValue* list = state->find("strategies"); list && list->isArray()) {
            strategies = std::get<JSONValue::Array>(list->value).size();
        }
        stateLine = std::format("Environment state: {}{}Strategies: {}", effective ? "enabled" : "disabled", kBullet,
                                strategies);
    }

    std::string text = done + ".\n" + stateLine + "\nView feature: " + link.url + "\nAdmin API: " + apiUrl;

    JSONValue::Object links;
    links["ui"] = std::make_shared<JSONValue>(link.url);
    links["api"] = std::make_shared<JSONValue>(apiUrl);
    links["resourceUri"] = std::make_shared<JSONValue>(link.resource.uri);

    JSONValue::Object structured;
    structured["success"] = std::make_shared<JSONValue>(true);
    structured["dryRun"] = std::make_shared<JSONValue>(ctx.config().dryRun);
    structured["projectId"] = std::make_shared<JSONValue>(projectId);
    structured["featureName"] = std::make_shared<JSONValue>(flagName);
    structured["environment"] = std::make_shared<JSONValue>(environment);
    structured["enabled"] = std::make_shared<JSONValue>(effective);
    structured["feature"] = std::make_shared<JSONValue>(std::move(feature));
    structured["links"] = std::make_shared<JSONValue>(std::move(links));

    CallToolResult result;
    result.content.push_back(typed::makeText(text));
    result.content.push_back(typed::makeResourceLink(flagName, link.resource));
    result.structuredContent = JSONValue{std::move(structured)};
    co_return result;
}
} // namespace

ToolDefinition MakeToggleFlagEnvironmentTool() {
    auto schema = std::make_shared<validation::ObjectSchema>();
    schema->String("projectId", "Project ID where the feature flag resides (optional if UNLEASH_DEFAULT_PROJECT is set)")
        .String("featureName", "Feature flag name", true, 1)
        .String("environment", "Environment to toggle (optional if UNLEASH_DEFAULT_ENVIRONMENT is set)", false, 1)
        .Boolean("enabled", "Set to true to enable the flag, or false to disable it", true);

    ToolDefinition def;
    def.name = TOGGLE_FLAG_ENVIRONMENT;
    def.description = "Enable or disable a feature flag in a specific environment using the Unleash Admin API.";
    def.validator = schema;
    def.handler = [](const ExecutionContext& ctx, const JSONValue& args, const std::optional<ProgressToken>& token) {
        return toggleFlagEnvironment(ctx, args, token).toFuture();
    };
    return def;
}

} // namespace tools
} // namespace flagbridge
