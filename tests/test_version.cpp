//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2026 flagbridge contributors
// File: test_version.cpp
// Purpose: Build version reporting
//==========================================================================================================

#include <gtest/gtest.h>
#include <chrono>

#include "flagbridge/InMemoryTransport.hpp"
#include "flagbridge/Protocol.h"
#include "flagbridge/Server.h"
#include "flagbridge/ToolRegistry.h"
#include "flagbridge/resources/ResourceTemplates.h"
#include "flagbridge/version.h"
#include "TestSupport.h"

using namespace flagbridge;
using namespace flagbridge::testsupport;

TEST(Version, MatchesProjectVersion) {
    EXPECT_EQ(getVersionString(), FLAGBRIDGE_EXPECTED_VERSION);
}

TEST(Version, ServerInfoDefaultsToBuildVersion) {
    TestContext env;
    Server server(ServerOptions{}, env.logger);
    ServerBindings bindings;
    bindings.context = env.context;
    bindings.tools = std::make_shared<const ToolDispatcher>(std::make_shared<ToolRegistry>(), env.context);
    bindings.resources = std::make_shared<resources::ResourceRouter>();

    auto [client, serverSide] = InMemoryTransport::CreatePair();
    client->Start().get();
    server.Start(std::move(serverSide), bindings).get();

    auto fut = client->SendRequest(std::make_unique<JSONRPCRequest>(
        JSONRPCId{int64_t{1}}, Methods::Initialize, ObjectOf({{"protocolVersion", JSONValue(PROTOCOL_VERSION)}})));
    ASSERT_EQ(fut.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    auto resp = fut.get();
    ASSERT_FALSE(resp->IsError());
    const JSONValue* info = resp->result->find("serverInfo");
    ASSERT_NE(info, nullptr);
    EXPECT_EQ(StringAt(*info, "version"), getVersionString());

    client->Close().get();
    server.Stop().get();
}
