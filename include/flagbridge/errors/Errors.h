//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// Copyright (c) 2026 flagbridge contributors
// File: Errors.h
// Purpose: Error taxonomy, typed failure exceptions and normalization into agent-facing errors
//==========================================================================================================

#pragma once

#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "flagbridge/JSONRPCTypes.h"

namespace flagbridge {
namespace errors {

// Fixed taxonomy surfaced to agents.
enum class ErrorKind {
    InvalidInput,
    MissingConfiguration,
    RemoteError,
    NotFoundTool,
    Unknown
};

// Machine-readable kind name ("InvalidInput", ...).
const char* errorKindName(ErrorKind kind);

//==========================================================================================================
// NormalizedError
// Purpose: Fixed-shape failure representation. Value type; produced fresh per failure.
//==========================================================================================================
struct NormalizedError {
    ErrorKind kind{ErrorKind::Unknown};
    std::string message;
    std::optional<std::string> hint;
};

// One field-level schema violation. path is the dotted field path ("" for the root value).
struct FieldViolation {
    std::string path;
    std::string message;
};

//////////////////////////////////////////// Failure origins ////////////////////////////////////////////

// Arguments did not satisfy a tool's input schema, or resource URI/options were malformed.
class InputValidationError : public std::runtime_error {
public:
    explicit InputValidationError(std::vector<FieldViolation> violations);
    explicit InputValidationError(const std::string& message);
    const std::vector<FieldViolation>& violations() const { return fieldViolations; }

private:
    std::vector<FieldViolation> fieldViolations;
};

// A required value was neither supplied nor configured.
class MissingConfigurationError : public std::runtime_error {
public:
    // what: human name of the value ("Project ID"); knob: env variable that would provide it.
    MissingConfigurationError(const std::string& what, const std::string& knob);
    const std::string& knob() const { return knobName; }

private:
    std::string knobName;
};

// Remote API failure. status is absent for connection-level failures.
class RemoteApiError : public std::runtime_error {
public:
    RemoteApiError(const std::string& message, std::optional<int> status = std::nullopt,
                   std::optional<std::string> code = std::nullopt);
    const std::optional<int>& status() const { return httpStatus; }
    const std::optional<std::string>& code() const { return remoteCode; }

private:
    std::optional<int> httpStatus;
    std::optional<std::string> remoteCode;
};

class NotFoundToolError : public std::runtime_error {
public:
    explicit NotFoundToolError(const std::string& toolName);
};

// Duplicate tool name or overlapping resource template at registration time. Startup-fatal.
class RegistrationConflictError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

// Carries an already-normalized error so normalization stays idempotent.
class NormalizedErrorException : public std::runtime_error {
public:
    explicit NormalizedErrorException(NormalizedError err);
    const NormalizedError& error() const { return normalized; }

private:
    NormalizedError normalized;
};

//////////////////////////////////////////// Normalization ////////////////////////////////////////////

//==========================================================================================================
// normalizeError
// Purpose: Maps any captured exception to the fixed taxonomy. Pure; never throws.
// Args:
//   error: Captured exception (may be null, which yields Unknown).
// Returns:
//   NormalizedError with kind, message and optional hint.
//==========================================================================================================
NormalizedError normalizeError(std::exception_ptr error) noexcept;

// Agent-facing text: "Error: <message>" plus "\n\nHint: <hint>" when present.
std::string formatErrorText(const NormalizedError& err);

// {code:<kind name>, message, hint?}
JSONValue toJson(const NormalizedError& err);

// JSON-RPC error code used when a failure surfaces at protocol level (e.g. resources/read).
int toJsonRpcCode(ErrorKind kind);

// JSON-RPC error response carrying {kind, hint?} in data.
std::unique_ptr<JSONRPCResponse> makeErrorResponse(const JSONRPCId& id, const NormalizedError& err);

} // namespace errors
} // namespace flagbridge
