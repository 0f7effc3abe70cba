//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2026 flagbridge contributors
// File: UnleashResources.cpp
// Purpose: Unleash resource readers
//==========================================================================================================

#include "flagbridge/ExecutionContext.h"
#include "flagbridge/async/FutureAwaitable.h"
#include "flagbridge/async/Task.h"
#include "flagbridge/resources/UnleashResources.h"

namespace flagbridge {
namespace resources {

namespace {
JSONValue wrapCollection(const char* key, JSONValue items, const QueryOptions& options) {
    JSONValue::Object body;
    int64_t count = 0;
    if (items.isArray()) {
        count = static_cast<int64_t>(std::get<JSONValue::Array>(items.value).size());
    }
    body[key] = std::make_shared<JSONValue>(std::move(items));
    body["count"] = std::make_shared<JSONValue>(count);
    if (options.limit.has_value()) {
        body["limit"] = std::make_shared<JSONValue>(options.limit.value());
    }
    body["order"] = std::make_shared<JSONValue>(
        std::string(options.order == SortOrder::Ascending ? "asc" : "desc"));
    body["offset"] = std::make_shared<JSONValue>(options.offset);
    return JSONValue{body};
}

async::Task<JSONValue> readProjects(const ExecutionContext& ctx, QueryOptions options) {
    auto items = co_await async::makeFutureAwaitable(ctx.remote().FetchProjects(options));
    co_return wrapCollection("projects", std::move(items), options);
}

async::Task<JSONValue> readFeatureFlags(const ExecutionContext& ctx, std::string projectId, QueryOptions options) {
    auto items = co_await async::makeFutureAwaitable(ctx.remote().FetchFeatures(projectId, options));
    JSONValue body = wrapCollection("features", std::move(items), options);
    std::get<JSONValue::Object>(body.value)["projectId"] = std::make_shared<JSONValue>(projectId);
    co_return body;
}
} // namespace

void RegisterUnleashResources(ResourceRouter& router) {
    router.Register({
        "unleash-projects-filtered",
        PROJECTS_TEMPLATE,
        "Unleash projects with optional query parameters. Use limit to control page size, order=asc|desc "
        "to sort by creation time, and offset to paginate.",
        [](const ExecutionContext& ctx, const PlaceholderMap&, const QueryOptions& options) {
            return readProjects(ctx, options).toFuture();
        }});

    router.Register({
        "unleash-feature-flags-by-project",
        FEATURE_FLAGS_TEMPLATE,
        "Feature flags for a specific Unleash project. Replace {projectId}; optional limit/order/offset "
        "parameters help paginate flags by creation time.",
        [](const ExecutionContext& ctx, const PlaceholderMap& placeholders, const QueryOptions& options) {
            return readFeatureFlags(ctx, placeholders.at("projectId"), options).toFuture();
        }});

    router.Register({
        "unleash-feature-flag",
        FEATURE_FLAG_TEMPLATE,
        "Single feature flag resource.",
        [](const ExecutionContext& ctx, const PlaceholderMap& placeholders, const QueryOptions&) {
            return ctx.remote().FetchFeature(placeholders.at("projectId"), placeholders.at("flagName"));
        }});
}

} // namespace resources
} // namespace flagbridge
