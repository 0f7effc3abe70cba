//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2026 flagbridge contributors
// File: ObjectSchema.cpp
// Purpose: Declarative object schema validation and JSON Schema export
//==========================================================================================================

#include <algorithm>
#include <stdexcept>

#include "flagbridge/validation/InputValidator.h"

namespace flagbridge {
namespace validation {

namespace {
const char* typeName(FieldType t) {
    switch (t) {
        case FieldType::String: return "string";
        case FieldType::Boolean: return "boolean";
        case FieldType::Integer: return "integer";
        case FieldType::Number: return "number";
    }
    return "string";
}

const char* describeValue(const JSONValue& v) {
    return std::visit([](const auto& x) -> const char* {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) return "null";
        else if constexpr (std::is_same_v<T, bool>) return "boolean";
        else if constexpr (std::is_same_v<T, int64_t>) return "integer";
        else if constexpr (std::is_same_v<T, double>) return "number";
        else if constexpr (std::is_same_v<T, std::string>) return "string";
        else if constexpr (std::is_same_v<T, JSONValue::Array>) return "array";
        else return "object";
    }, v.value);
}

bool matchesType(const JSONValue& v, FieldType t) {
    switch (t) {
        case FieldType::String: return std::holds_alternative<std::string>(v.value);
        case FieldType::Boolean: return std::holds_alternative<bool>(v.value);
        case FieldType::Integer: return std::holds_alternative<int64_t>(v.value);
        case FieldType::Number:
            return std::holds_alternative<int64_t>(v.value) || std::holds_alternative<double>(v.value);
    }
    return false;
}

// UTF-8 code point count, the unit minLength refers to.
std::size_t codePoints(const std::string& s) {
    std::size_t n = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80) ++n;
    }
    return n;
}
} // namespace

ObjectSchema& ObjectSchema::add(FieldSpec spec) {
    auto dup = std::find_if(specs.begin(), specs.end(), [&](const FieldSpec& f) { return f.name == spec.name; });
    if (dup != specs.end()) {
        throw std::invalid_argument("ObjectSchema: duplicate field " + spec.name);
    }
    specs.push_back(std::move(spec));
    return *this;
}

ObjectSchema& ObjectSchema::String(const std::string& name, const std::string& description, bool required,
                                   std::optional<std::size_t> minLength) {
    FieldSpec f;
    f.name = name; f.type = FieldType::String; f.required = required; f.description = description; f.minLength = minLength;
    return add(std::move(f));
}

ObjectSchema& ObjectSchema::Enum(const std::string& name, const std::string& description,
                                 std::vector<std::string> values, bool required) {
    FieldSpec f;
    f.name = name; f.type = FieldType::String; f.required = required; f.description = description;
    f.enumValues = std::move(values);
    return add(std::move(f));
}

ObjectSchema& ObjectSchema::Boolean(const std::string& name, const std::string& description, bool required) {
    FieldSpec f;
    f.name = name; f.type = FieldType::Boolean; f.required = required; f.description = description;
    return add(std::move(f));
}

ObjectSchema& ObjectSchema::Integer(const std::string& name, const std::string& description, bool required) {
    FieldSpec f;
    f.name = name; f.type = FieldType::Integer; f.required = required; f.description = description;
    return add(std::move(f));
}

ParseResult ObjectSchema::Parse(const JSONValue& raw) const {
    ParseResult result;
    if (!raw.isNull() && !raw.isObject()) {
        result.violations.push_back({"", std::string("Expected object, received ") + describeValue(raw)});
        return result;
    }

    JSONValue::Object out;
    for (const auto& spec : specs) {
        // An explicit null is a type mismatch, not an omitted field.
        const JSONValue* v = raw.find(spec.name);
        if (!v) {
            if (spec.required) {
                result.violations.push_back({spec.name, "Required"});
            }
            continue;
        }
        if (!matchesType(*v, spec.type)) {
            result.violations.push_back({spec.name, std::string("Expected ") + typeName(spec.type) +
                                                        ", received " + describeValue(*v)});
            continue;
        }
        if (spec.type == FieldType::String) {
            const auto& s = std::get<std::string>(v->value);
            if (spec.minLength.has_value() && codePoints(s) < spec.minLength.value()) {
                result.violations.push_back({spec.name, "String must contain at least " +
                                                            std::to_string(spec.minLength.value()) + " character(s)"});
                continue;
            }
            if (!spec.enumValues.empty() &&
                std::find(spec.enumValues.begin(), spec.enumValues.end(), s) == spec.enumValues.end()) {
                std::string allowed;
                for (const auto& e : spec.enumValues) {
                    if (!allowed.empty()) allowed += " | ";
                    allowed += "'" + e + "'";
                }
                result.violations.push_back({spec.name, "Invalid enum value. Expected " + allowed + ", received '" + s + "'"});
                continue;
            }
        }
        out[spec.name] = std::make_shared<JSONValue>(*v);
    }

    if (result.violations.empty()) {
        result.value = JSONValue{out};
    }
    return result;
}

JSONValue ObjectSchema::SchemaJson() const {
    JSONValue::Object properties;
    JSONValue::Array required;
    for (const auto& spec : specs) {
        JSONValue::Object prop;
        prop["type"] = std::make_shared<JSONValue>(std::string(typeName(spec.type)));
        if (!spec.description.empty()) {
            prop["description"] = std::make_shared<JSONValue>(spec.description);
        }
        if (spec.minLength.has_value()) {
            prop["minLength"] = std::make_shared<JSONValue>(static_cast<int64_t>(spec.minLength.value()));
        }
        if (!spec.enumValues.empty()) {
            JSONValue::Array values;
            for (const auto& e : spec.enumValues) values.push_back(std::make_shared<JSONValue>(e));
            prop["enum"] = std::make_shared<JSONValue>(values);
        }
        properties[spec.name] = std::make_shared<JSONValue>(prop);
        if (spec.required) {
            required.push_back(std::make_shared<JSONValue>(spec.name));
        }
    }
    JSONValue::Object schema;
    schema["type"] = std::make_shared<JSONValue>(std::string("object"));
    schema["properties"] = std::make_shared<JSONValue>(properties);
    if (!required.empty()) {
        schema["required"] = std::make_shared<JSONValue>(required);
    }
    return JSONValue{schema};
}

} // namespace validation
} // namespace flagbridge
