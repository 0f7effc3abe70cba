//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2026 flagbridge contributors
// File: QueryOptions.h
// Purpose: Collection query options (limit, order, offset) parsed from resource URIs
//==========================================================================================================

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>

#include "flagbridge/JSONRPCTypes.h"

namespace flagbridge {
namespace resources {

// Sort direction by creation time.
enum class SortOrder {
    Ascending,
    Descending
};

//==========================================================================================================
// QueryOptions
// Fields:
//   limit: Positive page size; std::nullopt means unbounded.
//   order: Creation-time order, Ascending by default.
//   offset: Items to skip, 0 by default.
//==========================================================================================================
struct QueryOptions {
    std::optional<int64_t> limit;
    SortOrder order{SortOrder::Ascending};
    int64_t offset{0};
};

// Decodes %XX escapes (and '+' as space in query values when plusAsSpace).
// Throws errors::InputValidationError on a malformed escape.
std::string percentDecode(const std::string& s, bool plusAsSpace = false);

// Encodes everything except RFC 3986 unreserved characters.
std::string percentEncode(const std::string& s);

// Splits the query component of uri into decoded key/value pairs (last occurrence wins).
std::unordered_map<std::string, std::string> parseQueryString(const std::string& uri);

//==========================================================================================================
// parseQueryOptions
// Purpose: Reads limit/order/offset from the URI's query string. Unknown keys are ignored.
// Notes:
//   order accepts asc|ascending|desc|descending (case-insensitive).
//   Invalid values fail with errors::InputValidationError naming every bad option; nothing is clamped.
//==========================================================================================================
QueryOptions parseQueryOptions(const std::string& uri);

//==========================================================================================================
// applyQueryOptions
// Purpose: Sorts items by their "createdAt" member (ISO-8601 strings compare lexicographically; items
//          without it sort first, ties keep input order), then applies offset and limit.
//==========================================================================================================
JSONValue::Array applyQueryOptions(const JSONValue::Array& items, const QueryOptions& options);

} // namespace resources
} // namespace flagbridge
