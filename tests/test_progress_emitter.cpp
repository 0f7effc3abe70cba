//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2026 flagbridge contributors
// File: test_progress_emitter.cpp
// Purpose: Progress and log notification emission
//==========================================================================================================

#include <gtest/gtest.h>
#include <stdexcept>

#include "flagbridge/ProgressEmitter.h"
#include "flagbridge/Protocol.h"
#include "TestSupport.h"

using namespace flagbridge;
using namespace flagbridge::testsupport;

TEST(ProgressEmitter, NoTokenSendsNothing) {
    RecordingSender rec;
    ProgressEmitter emitter(rec.Sender(), MakeNullLogger());
    emitter.Notify(std::nullopt, 0, 100, std::string("ignored"));
    emitter.Notify(std::nullopt, 100, 100);
    EXPECT_TRUE(rec.Sent().empty());
}

TEST(ProgressEmitter, ProgressThenLogMessage) {
    RecordingSender rec;
    ProgressEmitter emitter(rec.Sender(), MakeNullLogger(), "flagbridge");
    emitter.Notify(ProgressToken{std::string("tok")}, 0, 100, std::string("Starting..."));

    auto sent = rec.Sent();
    ASSERT_EQ(sent.size(), 2u);
    EXPECT_EQ(sent[0].method, Methods::Progress);
    ASSERT_TRUE(sent[0].params.has_value());
    EXPECT_EQ(GetStringField(*sent[0].params, "progressToken").value_or(""), "tok");
    EXPECT_EQ(GetIntField(*sent[0].params, "progress").value_or(-1), 0);
    EXPECT_EQ(GetIntField(*sent[0].params, "total").value_or(-1), 100);

    EXPECT_EQ(sent[1].method, Methods::Log);
    ASSERT_TRUE(sent[1].params.has_value());
    EXPECT_EQ(GetStringField(*sent[1].params, "level").value_or(""), "info");
    EXPECT_EQ(GetStringField(*sent[1].params, "logger").value_or(""), "flagbridge");
    EXPECT_EQ(GetStringField(*sent[1].params, "data").value_or(""), "Starting...");
}

TEST(ProgressEmitter, OrderPreservedAcrossCalls) {
    RecordingSender rec;
    ProgressEmitter emitter(rec.Sender(), MakeNullLogger());
    const ProgressToken token{int64_t{17}};
    emitter.Notify(token, 0, 100);
    emitter.Notify(token, 100, 100);

    auto progress = rec.Sent(Methods::Progress);
    ASSERT_EQ(progress.size(), 2u);
    EXPECT_EQ(GetIntField(*progress[0].params, "progressToken").value_or(0), 17);
    EXPECT_EQ(GetIntField(*progress[0].params, "progress").value_or(-1), 0);
    EXPECT_EQ(GetIntField(*progress[1].params, "progress").value_or(-1), 100);
    EXPECT_TRUE(rec.Sent(Methods::Log).empty());
}

TEST(ProgressEmitter, FractionalProgressStaysDouble) {
    RecordingSender rec;
    ProgressEmitter emitter(rec.Sender(), MakeNullLogger());
    emitter.Notify(ProgressToken{std::string("t")}, 12.5, 100);
    auto sent = rec.Sent();
    ASSERT_EQ(sent.size(), 1u);
    const JSONValue* p = sent[0].params->find("progress");
    ASSERT_NE(p, nullptr);
    ASSERT_TRUE(std::holds_alternative<double>(p->value));
    EXPECT_DOUBLE_EQ(std::get<double>(p->value), 12.5);
}

TEST(ProgressEmitter, SenderFailuresAreSwallowedAndLogged) {
    auto sink = std::make_shared<CapturingLogSink>();
    auto logger = std::make_shared<Logger>(Logger::Level::DEBUG, sink);
    int calls = 0;
    NotificationSender failing = [&calls](std::unique_ptr<JSONRPCNotification>) -> std::future<void> {
        ++calls;
        if (calls == 1) {
            throw std::runtime_error("transport gone");
        }
        std::promise<void> p;
        p.set_exception(std::make_exception_ptr(std::runtime_error("Peer not connected")));
        return p.get_future();
    };
    ProgressEmitter emitter(failing, logger);
    EXPECT_NO_THROW(emitter.Notify(ProgressToken{std::string("t")}, 0, 100, std::string("msg")));
    EXPECT_EQ(calls, 2);
    EXPECT_EQ(sink->Count("DEBUG"), 2u);
}

TEST(ProgressEmitter, NonStandardSenderFailuresAreDropped) {
    auto sink = std::make_shared<CapturingLogSink>();
    auto logger = std::make_shared<Logger>(Logger::Level::DEBUG, sink);
    int calls = 0;
    NotificationSender failing = [&calls](std::unique_ptr<JSONRPCNotification>) -> std::future<void> {
        if (++calls == 1) {
            throw 42;
        }
        std::promise<void> p;
        p.set_exception(std::make_exception_ptr(7));
        return p.get_future();
    };
    ProgressEmitter emitter(failing, logger);
    EXPECT_NO_THROW(emitter.Notify(ProgressToken{std::string("t")}, 0, 100, std::string("msg")));
    EXPECT_EQ(calls, 2);

    auto lines = sink->Lines();
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_NE(lines[0].text.find("Dropped notifications/progress notification: unknown error"), std::string::npos);
    EXPECT_NE(lines[1].text.find("Dropped notifications/message notification: unknown error"), std::string::npos);
}

TEST(ProgressEmitter, TokenFromParams) {
    JSONValue::Object meta;
    meta["progressToken"] = std::make_shared<JSONValue>(std::string("abc"));
    JSONValue::Object params;
    params["_meta"] = std::make_shared<JSONValue>(meta);
    auto token = progressTokenFromParams(JSONValue{params});
    ASSERT_TRUE(token.has_value());
    EXPECT_EQ(std::get<std::string>(token.value()), "abc");

    EXPECT_FALSE(progressTokenFromParams(JSONValue{JSONValue::Object{}}).has_value());
    EXPECT_FALSE(progressTokenFromParams(JSONValue{}).has_value());

    JSONValue::Object badMeta;
    badMeta["progressToken"] = std::make_shared<JSONValue>(true);
    JSONValue::Object badParams;
    badParams["_meta"] = std::make_shared<JSONValue>(badMeta);
    EXPECT_FALSE(progressTokenFromParams(JSONValue{badParams}).has_value());
}
