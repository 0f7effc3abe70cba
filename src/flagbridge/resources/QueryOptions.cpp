//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2026 flagbridge contributors
// File: QueryOptions.cpp
// Purpose: Query option parsing and client-side paging
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <charconv>
#include <vector>

#include "flagbridge/errors/Errors.h"
#include "flagbridge/resources/QueryOptions.h"

namespace flagbridge {
namespace resources {

namespace {
int hexValue(char h) {
    if (h >= '0' && h <= '9') return h - '0';
    if (h >= 'a' && h <= 'f') return 10 + (h - 'a');
    if (h >= 'A' && h <= 'F') return 10 + (h - 'A');
    return -1;
}

std::optional<int64_t> parseInteger(const std::string& s) {
    if (s.empty()) return std::nullopt;
    int64_t v = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
    return v;
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string createdAt(const std::shared_ptr<JSONValue>& item) {
    if (!item) return std::string();
    return GetStringField(*item, "createdAt").value_or(std::string());
}
} // namespace

std::string percentDecode(const std::string& s, bool plusAsSpace) {
    std::string out;
    out.reserve(s.size());
    for (std::size_t k = 0; k < s.size(); ++k) {
        char c = s[k];
        if (c == '%') {
            if (k + 2 >= s.size()) {
                throw errors::InputValidationError("Malformed percent-encoding in \"" + s + "\"");
            }
            int hi = hexValue(s[k + 1]);
            int lo = hexValue(s[k + 2]);
            if (hi < 0 || lo < 0) {
                throw errors::InputValidationError("Malformed percent-encoding in \"" + s + "\"");
            }
            out.push_back(static_cast<char>((hi << 4) | lo));
            k += 2;
        } else if (c == '+' && plusAsSpace) {
            out.push_back(' ');
        } else {
            out.push_back(c);
        }
    }
    return out;
}

std::string percentEncode(const std::string& s) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(hex[(c >> 4) & 0xF]);
            out.push_back(hex[c & 0xF]);
        }
    }
    return out;
}

std::unordered_map<std::string, std::string> parseQueryString(const std::string& uri) {
    std::unordered_map<std::string, std::string> out;
    const auto q = uri.find('?');
    if (q == std::string::npos) {
        return out;
    }
    std::string query = uri.substr(q + 1);
    const auto hash = query.find('#');
    if (hash != std::string::npos) query.erase(hash);
    std::size_t pos = 0;
    while (pos <= query.size()) {
        auto amp = query.find('&', pos);
        if (amp == std::string::npos) amp = query.size();
        const std::string pair = query.substr(pos, amp - pos);
        pos = amp + 1;
        if (pair.empty()) continue;
        const auto eq = pair.find('=');
        const std::string key = percentDecode(pair.substr(0, eq), true);
        const std::string value = eq == std::string::npos ? std::string() : percentDecode(pair.substr(eq + 1), true);
        out[key] = value;
    }
    return out;
}

QueryOptions parseQueryOptions(const std::string& uri) {
    QueryOptions options;
    std::vector<errors::FieldViolation> violations;
    const auto query = parseQueryString(uri);

    auto it = query.find("limit");
    if (it != query.end()) {
        auto v = parseInteger(it->second);
        if (!v.has_value() || v.value() <= 0) {
            violations.push_back({"limit", "must be a positive integer (got \"" + it->second + "\")"});
        } else {
            options.limit = v.value();
        }
    }

    it = query.find("offset");
    if (it != query.end()) {
        auto v = parseInteger(it->second);
        if (!v.has_value() || v.value() < 0) {
            violations.push_back({"offset", "must be a non-negative integer (got \"" + it->second + "\")"});
        } else {
            options.offset = v.value();
        }
    }

    it = query.find("order");
    if (it != query.end()) {
        const std::string o = lower(it->second);
        if (o == "asc" || o == "ascending") {
            options.order = SortOrder::Ascending;
        } else if (o == "desc" || o == "descending") {
            options.order = SortOrder::Descending;
        } else {
            violations.push_back({"order", "must be asc or desc (got \"" + it->second + "\")"});
        }
    }

    if (!violations.empty()) {
        throw errors::InputValidationError(std::move(violations));
    }
    return options;
}

JSONValue::Array applyQueryOptions(const JSONValue::Array& items, const QueryOptions& options) {
    JSONValue::Array sorted = items;
    std::stable_sort(sorted.begin(), sorted.end(), [&options](const auto& a, const auto& b) {
        if (options.order == SortOrder::Descending) {
            return createdAt(a) > createdAt(b);
        }
        return createdAt(a) < createdAt(b);
    });

    JSONValue::Array out;
    const auto total = static_cast<int64_t>(sorted.size());
    if (options.offset >= total) {
        return out;
    }
    int64_t end = total;
    if (options.limit.has_value() && options.limit.value() < total - options.offset) {
        end = options.offset + options.limit.value();
    }
    out.assign(sorted.begin() + options.offset, sorted.begin() + end);
    return out;
}

} // namespace resources
} // namespace flagbridge
