//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2026 flagbridge contributors
// File: CreateFlag.cpp
// Purpose: create_flag tool
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
std::string createdMessage(const std::string& flagName, const std::string& projectId, const std::string& url,
                           bool dryRun) {
    if (dryRun) {
        return std::format("[DRY RUN] Would create feature flag \"{}\" in project \"{}\".\nURL: {}", flagName,
                           projectId, url);
    }
    return std::format("Successfully created feature flag \"{}\" in project \"{}\".\nView in Unleash: {}", flagName,
                       projectId, url);
}

async::Task<CallToolResult> createFlag(const ExecutionContext& ctx, JSONValue args,
                                       std::optional<ProgressToken> token) {
    FeatureCreateRequest request;
    request.name = GetStringField(args, "name").value();
    request.type = GetStringField(args, "type").value();
    request.description = GetStringField(args, "description").value();
    request.impressionData = GetBoolField(args, "impressionData");
    const std::string projectId = ctx.ResolveProjectId(GetStringField(args, "projectId"));
    const bool dryRun = ctx.config().dryRun;

    ctx.progress().Notify(token, 0, 100,
                          std::format("Creating feature flag \"{}\" in project \"{}\"...", request.name, projectId));

    JSONValue created = co_await async::makeFutureAwaitable(ctx.remote().CreateFeature(projectId, request));

    ctx.progress().Notify(token, 100, 100, std::format("Created feature flag \"{}\"", request.name));

    const std::string flagName = GetStringField(created, "name").value_or(request.name);
    const auto link = CreateFlagResourceLink(ctx.config().remoteBaseUrl, projectId, flagName);
    const std::string apiUrl = FeatureApiUrl(ctx.config().remoteBaseUrl, projectId, flagName);

    FLAGBRIDGE_LOG_INFO(ctx.logger(), "{} feature flag \"{}\" in project \"{}\"", dryRun ? "Simulated" : "Created",
                        flagName, projectId);

    JSONValue::Object links;
    links["ui"] = std::make_shared<JSONValue>(link.url);
    links["api"] = std::make_shared<JSONValue>(apiUrl);
    links["resourceUri"] = std::make_shared<JSONValue>(link.resource.uri);

    JSONValue::Object structured;
    structured["success"] = std::make_shared<JSONValue>(true);
    structured["dryRun"] = std::make_shared<JSONValue>(dryRun);
    structured["projectId"] = std::make_shared<JSONValue>(projectId);
    structured["flag"] = std::make_shared<JSONValue>(std::move(created));
    structured["links"] = std::make_shared<JSONValue>(std::move(links));

    CallToolResult result;
    result.content.push_back(typed::makeText(createdMessage(flagName, projectId, link.url, dryRun)));
    result.content.push_back(typed::makeResourceLink(flagName, link.resource));
    result.structuredContent = JSONValue{std::move(structured)};
    co_return result;
}
} // namespace

ToolDefinition MakeCreateFlagTool() {
    auto schema = std::make_shared<validation::ObjectSchema>();
    schema->String("projectId", "Project ID where the feature flag will be created (optional if UNLEASH_DEFAULT_PROJECT is set)")
        .String("name", "Unique feature flag name within the project (e.g. new-checkout-flow)", true, 1)
        .Enum("type", "Flag type: release, experiment, operational, kill-switch or permission", FlagTypes(), true)
        .String("description", "Clear explanation of what the flag controls and why it exists", true, 1)
        .Boolean("impressionData", "Emit impression events for this flag (defaults to false)");

    ToolDefinition def;
    def.name = CREATE_FLAG;
    def.description =
        "Create a feature flag in Unleash. Pick the flag type that matches its purpose and describe what it "
        "controls; the result links to the flag in the Unleash Admin UI.";
    def.validator = schema;
    def.handler = [](const ExecutionContext& ctx, const JSONValue& args, const std::optional<ProgressToken>& token) {
        return createFlag(ctx, args, token).toFuture();
    };
    return def;
}

} // namespace tools
} // namespace flagbridge
