//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2026 flagbridge contributors
// File: test_unleash_resources.cpp
// Purpose: Unleash resource templates (projects, feature flags by project, single flag)
//==========================================================================================================

#include <gtest/gtest.h>

#include "flagbridge/errors/Errors.h"
#include "flagbridge/resources/UnleashResources.h"
#include "TestSupport.h"

using namespace flagbridge;
using namespace flagbridge::resources;
using namespace flagbridge::testsupport;

namespace {
JSONValue readBody(const ResourceRouter& router, const std::string& uri, const ExecutionContext& ctx) {
    auto result = router.Read(uri, ctx);
    EXPECT_EQ(result.contents.size(), 1u);
    EXPECT_EQ(result.contents.at(0).mimeType, "application/json");
    return ParseJson(result.contents.at(0).text);
}
} // namespace

TEST(UnleashResources, RegistersThreeTemplates) {
    ResourceRouter router;
    RegisterUnleashResources(router);
    auto listed = router.ListTemplates();
    ASSERT_EQ(listed.size(), 3u);
    EXPECT_EQ(listed[0].name, "unleash-projects-filtered");
    EXPECT_EQ(listed[1].name, "unleash-feature-flags-by-project");
    EXPECT_EQ(listed[2].name, "unleash-feature-flag");

    EXPECT_THROW(RegisterUnleashResources(router), errors::RegistrationConflictError);
}

TEST(UnleashResources, ProjectsCollectionEchoesOptions) {
    TestContext t;
    QueryOptions seen;
    t.remote->onFetchProjects = [&seen](const QueryOptions& o) {
        seen = o;
        return ArrayOf({ObjectOf({{"id", JSONValue("default")}}), ObjectOf({{"id", JSONValue("web")}})});
    };
    ResourceRouter router;
    RegisterUnleashResources(router);

    JSONValue body = readBody(router, "unleash://projects?limit=2&order=desc&offset=1", *t.context);
    EXPECT_EQ(GetIntField(body, "count").value_or(-1), 2);
    EXPECT_EQ(GetIntField(body, "limit").value_or(-1), 2);
    EXPECT_EQ(StringAt(body, "order"), "desc");
    EXPECT_EQ(GetIntField(body, "offset").value_or(-1), 1);
    ASSERT_NE(body.find("projects"), nullptr);

    EXPECT_EQ(seen.limit.value_or(0), 2);
    EXPECT_EQ(seen.order, SortOrder::Descending);
    EXPECT_EQ(seen.offset, 1);
}

TEST(UnleashResources, ProjectsWithoutQueryUseDefaults) {
    TestContext t;
    t.remote->onFetchProjects = [](const QueryOptions&) { return ArrayOf({}); };
    ResourceRouter router;
    RegisterUnleashResources(router);

    JSONValue body = readBody(router, "unleash://projects", *t.context);
    EXPECT_EQ(body.find("limit"), nullptr);
    EXPECT_EQ(StringAt(body, "order"), "asc");
    EXPECT_EQ(GetIntField(body, "offset").value_or(-1), 0);
    EXPECT_EQ(GetIntField(body, "count").value_or(-1), 0);
}

TEST(UnleashResources, FeatureFlagsByProject) {
    TestContext t;
    std::string seenProject;
    t.remote->onFetchFeatures = [&seenProject](const std::string& p, const QueryOptions&) {
        seenProject = p;
        return ArrayOf({ObjectOf({{"name", JSONValue("a")}})});
    };
    ResourceRouter router;
    RegisterUnleashResources(router);

    JSONValue body = readBody(router, "unleash://projects/web%20app/feature-flags", *t.context);
    EXPECT_EQ(seenProject, "web app");
    EXPECT_EQ(StringAt(body, "projectId"), "web app");
    EXPECT_EQ(GetIntField(body, "count").value_or(-1), 1);
}

TEST(UnleashResources, SingleFlagIsReturnedAsIs) {
    TestContext t;
    t.remote->onFetchFeature = [](const std::string& p, const std::string& f) {
        return ObjectOf({{"name", JSONValue(f)}, {"project", JSONValue(p)}});
    };
    ResourceRouter router;
    RegisterUnleashResources(router);

    JSONValue body = readBody(router, "unleash://projects/proj/feature-flags/flagX", *t.context);
    EXPECT_EQ(StringAt(body, "name"), "flagX");
    EXPECT_EQ(StringAt(body, "project"), "proj");
}

TEST(UnleashResources, RemoteFailureSurfaces) {
    TestContext t;
    t.remote->onFetchFeature = [](const std::string&, const std::string&) -> JSONValue {
        throw errors::RemoteApiError("Feature not found", 404, std::string("NotFoundError"));
    };
    ResourceRouter router;
    RegisterUnleashResources(router);
    EXPECT_THROW(router.Read("unleash://projects/p/feature-flags/missing", *t.context), errors::RemoteApiError);
}
