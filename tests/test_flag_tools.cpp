//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2026 flagbridge contributors
// File: test_flag_tools.cpp
// Purpose: create_flag, get_flag_state and toggle_flag_environment against a stubbed Unleash client
//==========================================================================================================

#include <gtest/gtest.h>
#include <memory>

#include "flagbridge/Protocol.h"
#include "flagbridge/errors/Errors.h"
#include "flagbridge/ToolRegistry.h"
#include "flagbridge/tools/FlagTools.h"
#include "flagbridge/typed/Content.h"
#include "TestSupport.h"

using namespace flagbridge;
using namespace flagbridge::testsupport;

namespace {
std::shared_ptr<ToolRegistry> flagRegistry() {
    auto registry = std::make_shared<ToolRegistry>();
    tools::RegisterFlagTools(*registry);
    return registry;
}

JSONValue sampleFeature(const std::string& name) {
    return ObjectOf({{"name", JSONValue(name)},
                     {"type", JSONValue("release")},
                     {"project", JSONValue("default")},
                     {"enabled", JSONValue(true)},
                     {"environments",
                      ArrayOf({ObjectOf({{"name", JSONValue("development")},
                                         {"enabled", JSONValue(true)},
                                         {"strategies", ArrayOf({ObjectOf({{"name", JSONValue("default")}})})}}),
                               ObjectOf({{"name", JSONValue("Production")},
                                         {"enabled", JSONValue(false)},
                                         {"strategies", ArrayOf({})}})})}});
}

const JSONValue& structured(const CallToolResult& r) {
    EXPECT_TRUE(r.structuredContent.has_value());
    return r.structuredContent.value();
}
} // namespace

TEST(FlagToolHelpers, CollapseDuplicateSlashes) {
    EXPECT_EQ(tools::CollapseDuplicateSlashes("https://u.example.com//projects///p"),
              "https://u.example.com/projects/p");
    EXPECT_EQ(tools::CollapseDuplicateSlashes("https://u.example.com/a?x=//y"), "https://u.example.com/a?x=//y");
    EXPECT_EQ(tools::CollapseDuplicateSlashes("/a//b"), "/a/b");
}

TEST(FlagToolHelpers, LinksAndApiUrl) {
    auto link = tools::CreateFlagResourceLink("https://u.example.com/", "default", "new-checkout");
    EXPECT_EQ(link.url, "https://u.example.com/projects/default/features/new-checkout");
    EXPECT_EQ(link.resource.uri, "unleash://projects/default/feature-flags/new-checkout");
    EXPECT_EQ(link.resource.mimeType, "application/json");
    EXPECT_EQ(link.resource.text, "Feature flag: new-checkout");

    EXPECT_EQ(tools::FeatureApiUrl("https://u.example.com", "my proj", "a/b"),
              "https://u.example.com/api/admin/projects/my%20proj/features/a%2Fb");
}

TEST(FlagToolHelpers, EnvironmentLookupIsCaseInsensitive) {
    JSONValue feature = sampleFeature("f");
    const JSONValue* prod = tools::FindEnvironment(feature, "production");
    ASSERT_NE(prod, nullptr);
    EXPECT_EQ(GetBoolField(*prod, "enabled").value_or(true), false);
    EXPECT_EQ(tools::FindEnvironment(feature, "staging"), nullptr);
    EXPECT_TRUE(tools::EnvironmentMatches(ObjectOf({{"environment", JSONValue("DEV")}}), "dev"));
}

TEST(CreateFlag, CreatesAndReportsProgress) {
    TestContext t;
    FeatureCreateRequest seen;
    std::string seenProject;
    t.remote->onCreateFeature = [&](const std::string& p, const FeatureCreateRequest& req) {
        seenProject = p;
        seen = req;
        return ObjectOf({{"name", JSONValue(req.name)}, {"type", JSONValue(req.type)}});
    };
    ToolDispatcher dispatcher(flagRegistry(), t.context);

    auto r = dispatcher.Invoke(tools::CREATE_FLAG,
                               ObjectOf({{"projectId", JSONValue("default")},
                                         {"name", JSONValue("new-checkout")},
                                         {"type", JSONValue("release")},
                                         {"description", JSONValue("Checkout rewrite")}}),
                               ProgressToken{std::string("p-1")});
    ASSERT_FALSE(r.isError) << typed::firstText(r).value_or("");
    EXPECT_EQ(seenProject, "default");
    EXPECT_EQ(seen.name, "new-checkout");
    EXPECT_EQ(seen.description, "Checkout rewrite");
    EXPECT_FALSE(seen.impressionData.has_value());

    EXPECT_EQ(typed::firstText(r).value_or(""),
              "Successfully created feature flag \"new-checkout\" in project \"default\".\n"
              "View in Unleash: https://unleash.example.com/projects/default/features/new-checkout");

    const JSONValue* link = typed::findContent(r, "resource_link");
    ASSERT_NE(link, nullptr);
    EXPECT_EQ(StringAt(*link, "uri"), "unleash://projects/default/feature-flags/new-checkout");
    EXPECT_EQ(StringAt(*link, "title"), "Feature flag: new-checkout");

    const JSONValue& s = structured(r);
    EXPECT_EQ(GetBoolField(s, "success").value_or(false), true);
    EXPECT_EQ(GetBoolField(s, "dryRun").value_or(true), false);
    const JSONValue* links = s.find("links");
    ASSERT_NE(links, nullptr);
    EXPECT_EQ(StringAt(*links, "api"), "https://unleash.example.com/api/admin/projects/default/features/new-checkout");

    auto progress = t.notifications.Sent(Methods::Progress);
    ASSERT_EQ(progress.size(), 2u);
    EXPECT_EQ(GetIntField(*progress[0].params, "progress").value_or(-1), 0);
    EXPECT_EQ(GetIntField(*progress[1].params, "progress").value_or(-1), 100);
    EXPECT_EQ(GetIntField(*progress[1].params, "total").value_or(-1), 100);

    auto messages = t.notifications.Sent(Methods::Log);
    ASSERT_EQ(messages.size(), 2u);
    EXPECT_EQ(GetStringField(*messages[0].params, "data").value_or(""),
              "Creating feature flag \"new-checkout\" in project \"default\"...");
    EXPECT_EQ(GetStringField(*messages[1].params, "data").value_or(""), "Created feature flag \"new-checkout\"");
}

TEST(CreateFlag, WithoutTokenNothingIsSent) {
    TestContext t;
    t.remote->onCreateFeature = [](const std::string&, const FeatureCreateRequest& req) {
        return ObjectOf({{"name", JSONValue(req.name)}});
    };
    ToolDispatcher dispatcher(flagRegistry(), t.context);
    auto r = dispatcher.Invoke(tools::CREATE_FLAG,
                               ObjectOf({{"projectId", JSONValue("default")},
                                         {"name", JSONValue("quiet")},
                                         {"type", JSONValue("operational")},
                                         {"description", JSONValue("d")},
                                         {"impressionData", JSONValue(true)}}),
                               std::nullopt);
    EXPECT_FALSE(r.isError);
    EXPECT_TRUE(t.notifications.Sent().empty());
}

TEST(CreateFlag, DryRunMessage) {
    Config cfg = MakeTestConfig();
    cfg.dryRun = true;
    cfg.defaultProject = "fallback";
    TestContext t(cfg);
    t.remote->onCreateFeature = [](const std::string&, const FeatureCreateRequest& req) {
        return ObjectOf({{"name", JSONValue(req.name)}, {"dryRun", JSONValue(true)}});
    };
    ToolDispatcher dispatcher(flagRegistry(), t.context);
    auto r = dispatcher.Invoke(tools::CREATE_FLAG,
                               ObjectOf({{"name", JSONValue("sim")},
                                         {"type", JSONValue("experiment")},
                                         {"description", JSONValue("d")}}),
                               std::nullopt);
    ASSERT_FALSE(r.isError);
    EXPECT_EQ(typed::firstText(r).value_or("").rfind("[DRY RUN] Would create feature flag \"sim\" in project "
                                                     "\"fallback\".",
                                                     0),
              0u);
    EXPECT_EQ(GetBoolField(structured(r), "dryRun").value_or(false), true);
    EXPECT_EQ(StringAt(structured(r), "projectId"), "fallback");
}

TEST(CreateFlag, InvalidTypeIsRejectedBeforeRemoteCall) {
    TestContext t;
    bool called = false;
    t.remote->onCreateFeature = [&called](const std::string&, const FeatureCreateRequest&) {
        called = true;
        return JSONValue{};
    };
    ToolDispatcher dispatcher(flagRegistry(), t.context);
    auto r = dispatcher.Invoke(tools::CREATE_FLAG,
                               ObjectOf({{"projectId", JSONValue("p")},
                                         {"name", JSONValue("x")},
                                         {"type", JSONValue("rollout")},
                                         {"description", JSONValue("d")}}),
                               std::nullopt);
    ASSERT_TRUE(r.isError);
    EXPECT_FALSE(called);
    EXPECT_NE(typed::firstText(r).value_or("").find("type"), std::string::npos);
}

TEST(GetFlagState, SummarizesAllEnvironments) {
    TestContext t;
    t.remote->onFetchFeature = [](const std::string&, const std::string& f) { return sampleFeature(f); };
    ToolDispatcher dispatcher(flagRegistry(), t.context);

    auto r = dispatcher.Invoke(tools::GET_FLAG_STATE,
                               ObjectOf({{"projectId", JSONValue("default")}, {"featureName", JSONValue("f1")}}),
                               std::nullopt);
    ASSERT_FALSE(r.isError) << typed::firstText(r).value_or("");
    const std::string text = typed::firstText(r).value_or("");
    EXPECT_NE(text.find("- development: enabled (1/1 active strategies)"), std::string::npos);
    EXPECT_NE(text.find("- Production: disabled (0/0 active strategies)"), std::string::npos);
    EXPECT_NE(text.find("View feature: https://unleash.example.com/projects/default/features/f1"), std::string::npos);

    const JSONValue* embedded = typed::findContent(r, "resource");
    ASSERT_NE(embedded, nullptr);
    const JSONValue* resource = embedded->find("resource");
    ASSERT_NE(resource, nullptr);
    EXPECT_EQ(StringAt(*resource, "uri"), "unleash://projects/default/feature-flags/f1");

    const JSONValue* envs = structured(r).find("environments");
    ASSERT_NE(envs, nullptr);
    EXPECT_EQ(std::get<JSONValue::Array>(envs->value).size(), 2u);
    EXPECT_EQ(structured(r).find("environmentFilter"), nullptr);
}

TEST(GetFlagState, EnvironmentFilter) {
    TestContext t;
    t.remote->onFetchFeature = [](const std::string&, const std::string& f) { return sampleFeature(f); };
    ToolDispatcher dispatcher(flagRegistry(), t.context);

    auto r = dispatcher.Invoke(tools::GET_FLAG_STATE,
                               ObjectOf({{"projectId", JSONValue("default")},
                                         {"featureName", JSONValue("f1")},
                                         {"environment", JSONValue("PRODUCTION")}}),
                               std::nullopt);
    ASSERT_FALSE(r.isError);
    const JSONValue* envs = structured(r).find("environments");
    ASSERT_NE(envs, nullptr);
    ASSERT_EQ(std::get<JSONValue::Array>(envs->value).size(), 1u);
    EXPECT_EQ(StringAt(structured(r), "environmentFilter"), "PRODUCTION");
    EXPECT_EQ(typed::firstText(r).value_or("").find("development"), std::string::npos);

    auto none = dispatcher.Invoke(tools::GET_FLAG_STATE,
                                  ObjectOf({{"projectId", JSONValue("default")},
                                            {"featureName", JSONValue("f1")},
                                            {"environment", JSONValue("staging")}}),
                                  std::nullopt);
    ASSERT_FALSE(none.isError);
    EXPECT_NE(typed::firstText(none).value_or("").find("- No environments matched the provided filters."),
              std::string::npos);
}

TEST(GetFlagState, RemoteNotFoundCarriesHint) {
    TestContext t;
    t.remote->onFetchFeature = [](const std::string&, const std::string&) -> JSONValue {
        throw errors::RemoteApiError("Feature missing", 404, std::string("NotFoundError"));
    };
    ToolDispatcher dispatcher(flagRegistry(), t.context);
    auto r = dispatcher.Invoke(tools::GET_FLAG_STATE,
                               ObjectOf({{"projectId", JSONValue("default")}, {"featureName", JSONValue("gone")}}),
                               std::nullopt);
    ASSERT_TRUE(r.isError);
    const JSONValue* err = structured(r).find("error");
    ASSERT_NE(err, nullptr);
    EXPECT_EQ(StringAt(*err, "code"), "RemoteError");
    EXPECT_NE(StringAt(*err, "hint").find("project ID"), std::string::npos);
    EXPECT_EQ(t.sink->Count("ERROR"), 1u);
}

TEST(ToggleFlagEnvironment, EnablesWithDefaultEnvironment) {
    Config cfg = MakeTestConfig();
    cfg.defaultEnvironment = "development";
    TestContext t(cfg);
    std::string seenEnv;
    bool seenEnabled = false;
    t.remote->onToggle = [&](const std::string&, const std::string& f, const std::string& env, bool on) {
        seenEnv = env;
        seenEnabled = on;
        return sampleFeature(f);
    };
    ToolDispatcher dispatcher(flagRegistry(), t.context);

    auto r = dispatcher.Invoke(tools::TOGGLE_FLAG_ENVIRONMENT,
                               ObjectOf({{"projectId", JSONValue("default")},
                                         {"featureName", JSONValue("f1")},
                                         {"enabled", JSONValue(true)}}),
                               ProgressToken{int64_t{3}});
    ASSERT_FALSE(r.isError) << typed::firstText(r).value_or("");
    EXPECT_EQ(seenEnv, "development");
    EXPECT_TRUE(seenEnabled);

    const std::string text = typed::firstText(r).value_or("");
    EXPECT_EQ(text.rfind("Enabled \"f1\" in \"development\".\nEnvironment state: enabled", 0), 0u);
    EXPECT_NE(text.find("Strategies: 1"), std::string::npos);
    EXPECT_NE(text.find("Admin API: https://unleash.example.com/api/admin/projects/default/features/f1/"
                        "environments/development/on"),
              std::string::npos);

    EXPECT_EQ(StringAt(structured(r), "environment"), "development");
    EXPECT_EQ(GetBoolField(structured(r), "enabled").value_or(false), true);
    EXPECT_EQ(t.notifications.Sent(Methods::Progress).size(), 2u);
}

TEST(ToggleFlagEnvironment, MissingEnvironmentWithoutDefault) {
    TestContext t;
    bool called = false;
    t.remote->onToggle = [&called](const std::string&, const std::string&, const std::string&, bool) {
        called = true;
        return JSONValue{};
    };
    ToolDispatcher dispatcher(flagRegistry(), t.context);

    auto r = dispatcher.Invoke(tools::TOGGLE_FLAG_ENVIRONMENT,
                               ObjectOf({{"projectId", JSONValue("default")},
                                         {"featureName", JSONValue("f1")},
                                         {"enabled", JSONValue(false)}}),
                               ProgressToken{std::string("t")});
    ASSERT_TRUE(r.isError);
    EXPECT_FALSE(called);
    const JSONValue* err = structured(r).find("error");
    ASSERT_NE(err, nullptr);
    EXPECT_EQ(StringAt(*err, "code"), "MissingConfiguration");
    EXPECT_NE(StringAt(*err, "hint").find("UNLEASH_DEFAULT_ENVIRONMENT"), std::string::npos);
    EXPECT_TRUE(t.notifications.Sent().empty());
}
