//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2026 flagbridge contributors
// File: InputValidator.h
// Purpose: Tool input validation capability and a declarative object schema implementation
//==========================================================================================================

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "flagbridge/JSONRPCTypes.h"
#include "flagbridge/errors/Errors.h"

namespace flagbridge {
namespace validation {

//==========================================================================================================
// ParseResult
// Purpose: Either the validated value (unknown members stripped) or every field violation found.
//==========================================================================================================
struct ParseResult {
    std::optional<JSONValue> value;
    std::vector<errors::FieldViolation> violations;

    bool ok() const { return value.has_value() && violations.empty(); }
};

//==========================================================================================================
// IInputValidator
// Purpose: Any validator exposing Parse(raw) is interchangeable at the tool registry boundary.
//==========================================================================================================
class IInputValidator {
public:
    virtual ~IInputValidator() = default;

    //==========================================================================================================
    // Validates raw tool arguments.
    // Args:
    //   raw: Arguments as received (null is treated as an empty object).
    // Returns:
    //   ParseResult carrying the typed value or all violations. Never throws for bad input.
    //==========================================================================================================
    virtual ParseResult Parse(const JSONValue& raw) const = 0;

    // JSON Schema advertised in tools/list.
    virtual JSONValue SchemaJson() const = 0;
};

enum class FieldType {
    String,
    Boolean,
    Integer,
    Number
};

// One declared member of an ObjectSchema.
struct FieldSpec {
    std::string name;
    FieldType type{FieldType::String};
    bool required{false};
    std::string description;
    std::optional<std::size_t> minLength;
    std::vector<std::string> enumValues;
};

//==========================================================================================================
// ObjectSchema
// Purpose: Flat object schema with typed members, required flags, string length and enum constraints.
// Notes:
//   - Undeclared members are dropped from the parsed value rather than rejected, so the exported schema
//     does not claim additionalProperties:false.
//   - A declared member sent as null fails its type check even when it is optional.
// Usage:
//   ObjectSchema s;
//   s.String("featureName", "Feature flag name", /*required*/ true, /*minLength*/ 1)
//    .Boolean("enabled", "Target state", true);
//==========================================================================================================
class ObjectSchema : public IInputValidator {
public:
    ObjectSchema& String(const std::string& name, const std::string& description, bool required = false,
                         std::optional<std::size_t> minLength = std::nullopt);
    ObjectSchema& Enum(const std::string& name, const std::string& description, std::vector<std::string> values,
                       bool required = false);
    ObjectSchema& Boolean(const std::string& name, const std::string& description, bool required = false);
    ObjectSchema& Integer(const std::string& name, const std::string& description, bool required = false);

    ParseResult Parse(const JSONValue& raw) const override;
    JSONValue SchemaJson() const override;

    const std::vector<FieldSpec>& fields() const { return specs; }

private:
    ObjectSchema& add(FieldSpec spec);
    std::vector<FieldSpec> specs;
};

} // namespace validation
} // namespace flagbridge
