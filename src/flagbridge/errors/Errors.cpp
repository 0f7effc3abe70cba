//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// Copyright (c) 2026 flagbridge contributors
// File: Errors.cpp
// Purpose: Failure exceptions and error normalization
//==========================================================================================================

#include <sstream>

#include "flagbridge/errors/Errors.h"

namespace flagbridge {
namespace errors {

namespace {
std::string joinViolations(const std::vector<FieldViolation>& violations) {
    std::ostringstream oss;
    oss << "Invalid input: ";
    bool first = true;
    for (const auto& v : violations) {
        if (!first) oss << "; ";
        first = false;
        if (v.path.empty()) oss << v.message;
        else oss << v.path << ": " << v.message;
    }
    if (violations.empty()) oss << "arguments do not match the input schema";
    return oss.str();
}

std::string remoteMessage(const std::string& message, const std::optional<int>& status,
                          const std::optional<std::string>& code) {
    if (!status.has_value()) {
        return message;
    }
    std::ostringstream oss;
    oss << "Unleash API error (status " << status.value();
    if (code.has_value() && !code->empty()) oss << ", code " << code.value();
    oss << "): " << message;
    return oss.str();
}
} // namespace

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidInput: return "InvalidInput";
        case ErrorKind::MissingConfiguration: return "MissingConfiguration";
        case ErrorKind::RemoteError: return "RemoteError";
        case ErrorKind::NotFoundTool: return "NotFoundTool";
        case ErrorKind::Unknown: return "Unknown";
    }
    return "Unknown";
}

InputValidationError::InputValidationError(std::vector<FieldViolation> violations)
    : std::runtime_error(joinViolations(violations)), fieldViolations(std::move(violations)) {}

InputValidationError::InputValidationError(const std::string& message)
    : std::runtime_error(message) {}

MissingConfigurationError::MissingConfigurationError(const std::string& what, const std::string& knob)
    : std::runtime_error(what + " is required. Either provide it as a parameter or set " + knob +
                         " in your .env file."),
      knobName(knob) {}

RemoteApiError::RemoteApiError(const std::string& message, std::optional<int> status,
                               std::optional<std::string> code)
    : std::runtime_error(remoteMessage(message, status, code)), httpStatus(status), remoteCode(std::move(code)) {}

NotFoundToolError::NotFoundToolError(const std::string& toolName)
    : std::runtime_error("Unknown tool: " + toolName) {}

NormalizedErrorException::NormalizedErrorException(NormalizedError err)
    : std::runtime_error(err.message), normalized(std::move(err)) {}

NormalizedError normalizeError(std::exception_ptr error) noexcept {
    NormalizedError out;
    if (!error) {
        out.kind = ErrorKind::Unknown;
        out.message = "Unknown error";
        return out;
    }
    try {
        std::rethrow_exception(error);
    } catch (const NormalizedErrorException& e) {
        out = e.error();
    } catch (const InputValidationError& e) {
        out.kind = ErrorKind::InvalidInput;
        out.message = e.what();
    } catch (const MissingConfigurationError& e) {
        out.kind = ErrorKind::MissingConfiguration;
        out.message = e.what();
        out.hint = "Set " + e.knob() + " in the environment or .env file, or pass the value explicitly.";
    } catch (const RemoteApiError& e) {
        out.kind = ErrorKind::RemoteError;
        out.message = e.what();
        if (!e.status().has_value()) {
            out.hint = "Could not reach the Unleash API. Check UNLEASH_BASE_URL and network connectivity.";
        } else if (e.status().value() == 401 || e.status().value() == 403) {
            out.hint = "Check that UNLEASH_PAT is a valid personal access token with the required permissions.";
        } else if (e.status().value() == 404) {
            out.hint = "Verify the project ID and feature flag name exist in Unleash.";
        }
    } catch (const NotFoundToolError& e) {
        out.kind = ErrorKind::NotFoundTool;
        out.message = e.what();
    } catch (const std::exception& e) {
        out.kind = ErrorKind::Unknown;
        out.message = e.what();
    } catch (...) {
        out.kind = ErrorKind::Unknown;
        out.message = "Unknown error";
    }
    return out;
}

std::string formatErrorText(const NormalizedError& err) {
    std::string text = "Error: " + err.message;
    if (err.hint.has_value()) {
        text += "\n\nHint: " + err.hint.value();
    }
    return text;
}

JSONValue toJson(const NormalizedError& err) {
    JSONValue::Object obj;
    obj["code"] = std::make_shared<JSONValue>(std::string(errorKindName(err.kind)));
    obj["message"] = std::make_shared<JSONValue>(err.message);
    if (err.hint.has_value()) {
        obj["hint"] = std::make_shared<JSONValue>(err.hint.value());
    }
    return JSONValue{obj};
}

int toJsonRpcCode(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidInput: return JSONRPCErrorCodes::InvalidParams;
        case ErrorKind::NotFoundTool: return JSONRPCErrorCodes::ToolNotFound;
        case ErrorKind::MissingConfiguration:
        case ErrorKind::RemoteError:
        case ErrorKind::Unknown:
            return JSONRPCErrorCodes::InternalError;
    }
    return JSONRPCErrorCodes::InternalError;
}

std::unique_ptr<JSONRPCResponse> makeErrorResponse(const JSONRPCId& id, const NormalizedError& err) {
    JSONValue::Object data;
    data["kind"] = std::make_shared<JSONValue>(std::string(errorKindName(err.kind)));
    if (err.hint.has_value()) {
        data["hint"] = std::make_shared<JSONValue>(err.hint.value());
    }
    return CreateErrorResponse(id, toJsonRpcCode(err.kind), err.message, JSONValue{data});
}

} // namespace errors
} // namespace flagbridge
