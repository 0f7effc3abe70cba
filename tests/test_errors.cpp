//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// Copyright (c) 2026 flagbridge contributors
// File: test_errors.cpp
// Purpose: Error taxonomy, normalization and JSON-RPC error mapping
//==========================================================================================================

#include <gtest/gtest.h>
#include <functional>
#include <stdexcept>

#include "flagbridge/JSONRPCTypes.h"
#include "flagbridge/errors/Errors.h"

using namespace flagbridge;
using namespace flagbridge::errors;

namespace {
NormalizedError normalizeThrown(const std::function<void()>& thrower) {
    try {
        thrower();
    } catch (...) {
        return normalizeError(std::current_exception());
    }
    return normalizeError(nullptr);
}
} // namespace

TEST(Errors, KindNames) {
    EXPECT_STREQ(errorKindName(ErrorKind::InvalidInput), "InvalidInput");
    EXPECT_STREQ(errorKindName(ErrorKind::MissingConfiguration), "MissingConfiguration");
    EXPECT_STREQ(errorKindName(ErrorKind::RemoteError), "RemoteError");
    EXPECT_STREQ(errorKindName(ErrorKind::NotFoundTool), "NotFoundTool");
    EXPECT_STREQ(errorKindName(ErrorKind::Unknown), "Unknown");
}

TEST(Errors, InputValidationMessageNamesEveryField) {
    auto n = normalizeThrown([] {
        throw InputValidationError(std::vector<FieldViolation>{{"name", "Required"}, {"type", "Invalid enum value"}});
    });
    EXPECT_EQ(n.kind, ErrorKind::InvalidInput);
    EXPECT_EQ(n.message, "Invalid input: name: Required; type: Invalid enum value");
    EXPECT_FALSE(n.hint.has_value());
}

TEST(Errors, MissingConfigurationCarriesKnobHint) {
    auto n = normalizeThrown([] { throw MissingConfigurationError("Project ID", "UNLEASH_DEFAULT_PROJECT"); });
    EXPECT_EQ(n.kind, ErrorKind::MissingConfiguration);
    EXPECT_NE(n.message.find("Project ID is required"), std::string::npos);
    ASSERT_TRUE(n.hint.has_value());
    EXPECT_NE(n.hint->find("UNLEASH_DEFAULT_PROJECT"), std::string::npos);
}

TEST(Errors, RemoteErrorHintsByStatus) {
    auto unauthorized = normalizeThrown([] { throw RemoteApiError("bad token", 401, std::string("AuthenticationRequired")); });
    EXPECT_EQ(unauthorized.kind, ErrorKind::RemoteError);
    EXPECT_NE(unauthorized.message.find("status 401"), std::string::npos);
    EXPECT_NE(unauthorized.message.find("AuthenticationRequired"), std::string::npos);
    ASSERT_TRUE(unauthorized.hint.has_value());
    EXPECT_NE(unauthorized.hint->find("UNLEASH_PAT"), std::string::npos);

    auto missing = normalizeThrown([] { throw RemoteApiError("no such feature", 404); });
    ASSERT_TRUE(missing.hint.has_value());
    EXPECT_NE(missing.hint->find("project ID"), std::string::npos);

    auto unreachable = normalizeThrown([] { throw RemoteApiError("Failed to reach Unleash at example: refused"); });
    EXPECT_EQ(unreachable.message, "Failed to reach Unleash at example: refused");
    ASSERT_TRUE(unreachable.hint.has_value());
    EXPECT_NE(unreachable.hint->find("UNLEASH_BASE_URL"), std::string::npos);

    auto conflict = normalizeThrown([] { throw RemoteApiError("exists", 409, std::string("NameExistsError")); });
    EXPECT_FALSE(conflict.hint.has_value());
}

TEST(Errors, NotFoundToolAndUnknown) {
    auto tool = normalizeThrown([] { throw NotFoundToolError("nope"); });
    EXPECT_EQ(tool.kind, ErrorKind::NotFoundTool);
    EXPECT_EQ(tool.message, "Unknown tool: nope");

    auto generic = normalizeThrown([] { throw std::runtime_error("boom"); });
    EXPECT_EQ(generic.kind, ErrorKind::Unknown);
    EXPECT_EQ(generic.message, "boom");

    auto nonStd = normalizeThrown([] { throw 42; });
    EXPECT_EQ(nonStd.kind, ErrorKind::Unknown);
    EXPECT_FALSE(nonStd.message.empty());

    auto none = normalizeError(nullptr);
    EXPECT_EQ(none.kind, ErrorKind::Unknown);
}

TEST(Errors, NormalizationIsIdempotent) {
    NormalizedError original{ErrorKind::RemoteError, "Unleash API error (status 500): down", std::string("retry later")};
    auto again = normalizeThrown([&] { throw NormalizedErrorException(original); });
    EXPECT_EQ(again.kind, original.kind);
    EXPECT_EQ(again.message, original.message);
    EXPECT_EQ(again.hint, original.hint);
}

TEST(Errors, FormatTextAndJson) {
    NormalizedError err{ErrorKind::MissingConfiguration, "Environment is required.", std::string("Set it.")};
    EXPECT_EQ(formatErrorText(err), "Error: Environment is required.\n\nHint: Set it.");

    NormalizedError plain{ErrorKind::Unknown, "boom", std::nullopt};
    EXPECT_EQ(formatErrorText(plain), "Error: boom");

    JSONValue j = toJson(err);
    EXPECT_EQ(GetStringField(j, "code").value_or(""), "MissingConfiguration");
    EXPECT_EQ(GetStringField(j, "message").value_or(""), "Environment is required.");
    EXPECT_EQ(GetStringField(j, "hint").value_or(""), "Set it.");
    EXPECT_EQ(toJson(plain).find("hint"), nullptr);
}

TEST(Errors, JsonRpcMapping) {
    EXPECT_EQ(toJsonRpcCode(ErrorKind::InvalidInput), JSONRPCErrorCodes::InvalidParams);
    EXPECT_EQ(toJsonRpcCode(ErrorKind::NotFoundTool), JSONRPCErrorCodes::ToolNotFound);
    EXPECT_EQ(toJsonRpcCode(ErrorKind::RemoteError), JSONRPCErrorCodes::InternalError);
    EXPECT_EQ(toJsonRpcCode(ErrorKind::MissingConfiguration), JSONRPCErrorCodes::InternalError);
    EXPECT_EQ(toJsonRpcCode(ErrorKind::Unknown), JSONRPCErrorCodes::InternalError);

    auto resp = makeErrorResponse(JSONRPCId{int64_t{7}},
                                  NormalizedError{ErrorKind::InvalidInput, "No resource matches x://y", std::nullopt});
    ASSERT_TRUE(resp != nullptr);
    ASSERT_TRUE(resp->IsError());
    EXPECT_EQ(GetIntField(*resp->error, "code").value_or(0), JSONRPCErrorCodes::InvalidParams);
    EXPECT_EQ(GetStringField(*resp->error, "message").value_or(""), "No resource matches x://y");
    const JSONValue* data = resp->error->find("data");
    ASSERT_TRUE(data != nullptr);
    EXPECT_EQ(GetStringField(*data, "kind").value_or(""), "InvalidInput");
}
