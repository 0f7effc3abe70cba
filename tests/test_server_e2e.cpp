//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2026 flagbridge contributors
// File: test_server_e2e.cpp
// Purpose: End-to-end MCP requests against the server over an in-memory transport pair
//==========================================================================================================

#include <gtest/gtest.h>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <vector>

#include "flagbridge/InMemoryTransport.hpp"
#include "flagbridge/Protocol.h"
#include "flagbridge/errors/Errors.h"
#include "flagbridge/Server.h"
#include "flagbridge/ToolRegistry.h"
#include "flagbridge/resources/UnleashResources.h"
#include "flagbridge/tools/FlagTools.h"
#include "TestSupport.h"

using namespace flagbridge;
using namespace flagbridge::testsupport;

namespace {

class ServerE2ETest : public ::testing::Test {
protected:
    void SetUp() override {
        sink = std::make_shared<CapturingLogSink>();
        logger = std::make_shared<Logger>(Logger::Level::DEBUG, sink);
        remote = std::make_shared<StubRemoteClient>();

        ServerOptions opts;
        opts.version = "test";
        opts.instructions = "Use the flag tools.";
        server = std::make_unique<Server>(opts, logger);

        auto emitter = std::make_shared<const ProgressEmitter>(server->GetNotificationSender(), logger);
        Config cfg = MakeTestConfig();
        cfg.defaultProject = "default";
        auto context = MakeExecutionContext(cfg, remote, logger, emitter);

        auto registry = std::make_shared<ToolRegistry>();
        tools::RegisterFlagTools(*registry);
        auto router = std::make_shared<resources::ResourceRouter>();
        resources::RegisterUnleashResources(*router);

        ServerBindings bindings;
        bindings.context = context;
        bindings.tools = std::make_shared<const ToolDispatcher>(registry, context);
        bindings.resources = router;

        auto pair = InMemoryTransport::CreatePair(logger);
        client = std::move(pair.first);
        client->SetNotificationHandler([this](std::unique_ptr<JSONRPCNotification> n) {
            std::lock_guard<std::mutex> lk(notesMutex);
            notes.push_back(*n);
            notesCv.notify_all();
        });
        client->Start().get();
        server->Start(std::move(pair.second), bindings).get();
    }

    void TearDown() override {
        client->Close().get();
        server->Stop().get();
    }

    std::unique_ptr<JSONRPCResponse> call(const std::string& method, std::optional<JSONValue> params = std::nullopt) {
        auto fut = client->SendRequest(std::make_unique<JSONRPCRequest>(JSONRPCId{int64_t{++nextId}}, method,
                                                                        std::move(params)));
        EXPECT_EQ(fut.wait_for(std::chrono::seconds(5)), std::future_status::ready);
        return fut.get();
    }

    std::vector<JSONRPCNotification> waitForNotes(std::size_t count) {
        std::unique_lock<std::mutex> lk(notesMutex);
        notesCv.wait_for(lk, std::chrono::seconds(2), [&] { return notes.size() >= count; });
        return notes;
    }

    std::shared_ptr<CapturingLogSink> sink;
    std::shared_ptr<Logger> logger;
    std::shared_ptr<StubRemoteClient> remote;
    std::unique_ptr<Server> server;
    std::unique_ptr<InMemoryTransport> client;
    int64_t nextId{0};

    std::mutex notesMutex;
    std::condition_variable notesCv;
    std::vector<JSONRPCNotification> notes;
};

} // namespace

TEST_F(ServerE2ETest, InitializeAdvertisesToolsResourcesLogging) {
    auto resp = call(Methods::Initialize,
                     ObjectOf({{"protocolVersion", JSONValue(PROTOCOL_VERSION)},
                               {"clientInfo", ObjectOf({{"name", JSONValue("e2e")}, {"version", JSONValue("1")}})}}));
    ASSERT_FALSE(resp->IsError());
    const JSONValue& result = resp->result.value();
    EXPECT_EQ(StringAt(result, "protocolVersion"), PROTOCOL_VERSION);
    EXPECT_EQ(StringAt(result, "instructions"), "Use the flag tools.");
    const JSONValue* caps = result.find("capabilities");
    ASSERT_NE(caps, nullptr);
    EXPECT_NE(caps->find("tools"), nullptr);
    EXPECT_NE(caps->find("resources"), nullptr);
    EXPECT_NE(caps->find("logging"), nullptr);
    const JSONValue* info = result.find("serverInfo");
    ASSERT_NE(info, nullptr);
    EXPECT_EQ(StringAt(*info, "name"), "flagbridge");
    EXPECT_EQ(StringAt(*info, "version"), "test");
}

TEST_F(ServerE2ETest, ListsToolsAndTemplates) {
    auto tools = call(Methods::ListTools);
    ASSERT_FALSE(tools->IsError());
    const auto& list = std::get<JSONValue::Array>(tools->result->find("tools")->value);
    ASSERT_EQ(list.size(), 3u);
    EXPECT_EQ(StringAt(*list[0], "name"), "create_flag");
    EXPECT_NE(list[0]->find("inputSchema"), nullptr);

    auto templates = call(Methods::ListResourceTemplates);
    ASSERT_FALSE(templates->IsError());
    const auto& tl = std::get<JSONValue::Array>(templates->result->find("resourceTemplates")->value);
    EXPECT_EQ(tl.size(), 3u);
    EXPECT_EQ(StringAt(*tl[2], "uriTemplate"), resources::FEATURE_FLAG_TEMPLATE);
}

TEST_F(ServerE2ETest, ToolCallStreamsProgressBeforeResult) {
    remote->onCreateFeature = [](const std::string&, const FeatureCreateRequest& req) {
        return ObjectOf({{"name", JSONValue(req.name)}});
    };
    auto resp = call(Methods::CallTool,
                     ObjectOf({{"name", JSONValue("create_flag")},
                               {"arguments", ObjectOf({{"name", JSONValue("e2e-flag")},
                                                       {"type", JSONValue("release")},
                                                       {"description", JSONValue("d")}})},
                               {"_meta", ObjectOf({{"progressToken", JSONValue("tok-9")}})}}));
    ASSERT_FALSE(resp->IsError());
    EXPECT_EQ(GetBoolField(*resp->result, "isError").value_or(false), false);

    auto seen = waitForNotes(4);
    std::vector<int64_t> progress;
    for (const auto& n : seen) {
        if (n.method != Methods::Progress) continue;
        EXPECT_EQ(GetStringField(*n.params, "progressToken").value_or(""), "tok-9");
        progress.push_back(GetIntField(*n.params, "progress").value_or(-1));
    }
    EXPECT_EQ(progress, (std::vector<int64_t>{0, 100}));
}

TEST_F(ServerE2ETest, ToolFailureIsResultNotProtocolError) {
    auto unknown = call(Methods::CallTool, ObjectOf({{"name", JSONValue("delete_everything")}}));
    ASSERT_FALSE(unknown->IsError());
    EXPECT_EQ(GetBoolField(*unknown->result, "isError").value_or(false), true);

    auto invalid = call(Methods::CallTool, ObjectOf({{"name", JSONValue("get_flag_state")},
                                                     {"arguments", ObjectOf({})}}));
    ASSERT_FALSE(invalid->IsError());
    EXPECT_EQ(GetBoolField(*invalid->result, "isError").value_or(false), true);
    const JSONValue* sc = invalid->result->find("structuredContent");
    ASSERT_NE(sc, nullptr);
    EXPECT_EQ(StringAt(*sc->find("error"), "code"), "InvalidInput");
}

TEST_F(ServerE2ETest, ToolCallWithoutNameIsInvalidParams) {
    auto resp = call(Methods::CallTool, ObjectOf({{"arguments", ObjectOf({})}}));
    ASSERT_TRUE(resp->IsError());
    EXPECT_EQ(GetIntField(*resp->error, "code").value_or(0), JSONRPCErrorCodes::InvalidParams);
}

TEST_F(ServerE2ETest, ReadResourceSuccessAndFailure) {
    remote->onFetchFeature = [](const std::string& p, const std::string& f) -> JSONValue {
        if (f == "missing") {
            throw errors::RemoteApiError("Feature not found", 404, std::string("NotFoundError"));
        }
        return ObjectOf({{"name", JSONValue(f)}, {"project", JSONValue(p)}});
    };

    auto ok = call(Methods::ReadResource, ObjectOf({{"uri", JSONValue("unleash://projects/default/feature-flags/f1")}}));
    ASSERT_FALSE(ok->IsError());
    const auto& contents = std::get<JSONValue::Array>(ok->result->find("contents")->value);
    ASSERT_EQ(contents.size(), 1u);
    EXPECT_EQ(StringAt(*contents[0], "mimeType"), "application/json");
    EXPECT_EQ(StringAt(ParseJson(StringAt(*contents[0], "text")), "name"), "f1");

    auto failed =
        call(Methods::ReadResource, ObjectOf({{"uri", JSONValue("unleash://projects/default/feature-flags/missing")}}));
    ASSERT_TRUE(failed->IsError());
    const JSONValue* data = failed->error->find("data");
    ASSERT_NE(data, nullptr);
    EXPECT_EQ(StringAt(*data, "kind"), "RemoteError");
    EXPECT_EQ(GetIntField(*failed->error, "code").value_or(0), JSONRPCErrorCodes::InternalError);

    auto unmatched = call(Methods::ReadResource, ObjectOf({{"uri", JSONValue("unleash://nowhere")}}));
    ASSERT_TRUE(unmatched->IsError());
    EXPECT_EQ(GetIntField(*unmatched->error, "code").value_or(0), JSONRPCErrorCodes::InvalidParams);
    EXPECT_EQ(StringAt(*unmatched->error->find("data"), "kind"), "InvalidInput");
}

TEST_F(ServerE2ETest, UnknownMethodAndPing) {
    auto resp = call("flags/explode");
    ASSERT_TRUE(resp->IsError());
    EXPECT_EQ(GetIntField(*resp->error, "code").value_or(0), JSONRPCErrorCodes::MethodNotFound);

    auto ping = call(Methods::Ping);
    EXPECT_FALSE(ping->IsError());
    auto resourcesList = call(Methods::ListResources);
    ASSERT_FALSE(resourcesList->IsError());
    EXPECT_TRUE(std::get<JSONValue::Array>(resourcesList->result->find("resources")->value).empty());
}

TEST(Server, StartRequiresBindings) {
    Server server(ServerOptions{}, MakeNullLogger());
    auto pair = InMemoryTransport::CreatePair();
    EXPECT_THROW(server.Start(std::move(pair.second), ServerBindings{}), std::invalid_argument);
    EXPECT_THROW(server.Start(nullptr, ServerBindings{}), std::invalid_argument);
    EXPECT_FALSE(server.IsRunning());
}
