//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Typed exceptions and error helpers for the cdev client
//==========================================================================================================

#pragma once

#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <variant>

#include "cdev/JSONValue.h"

namespace cdev {
namespace errors {

// Categorization of client failures.
enum class ErrorCategory {
    Connection,
    Protocol,
    Transport,
    Decode,
    Unknown
};

// Numeric codes rendered in messages; 44 and 54 match the codes operators already know.
namespace ErrorCodes {
    constexpr int Connection = 44;
    constexpr int Protocol = 54;
    constexpr int Transport = 64;
    constexpr int Decode = 74;
}

inline const char* categoryName(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::Connection: return "connection";
        case ErrorCategory::Protocol: return "protocol";
        case ErrorCategory::Transport: return "transport";
        case ErrorCategory::Decode: return "decode";
        default: return "unknown";
    }
}

//==========================================================================================================
// CdevError
// Purpose: Base of all cdev exceptions. what() renders "CDev Exception #<code>: <description>".
//==========================================================================================================
class CdevError : public std::runtime_error {
public:
    CdevError(ErrorCategory category, int code, const std::string& description)
        : std::runtime_error("CDev Exception #" + std::to_string(code) + ": " + description),
          category_(category), code_(code), description_(description) {}

    ErrorCategory category() const noexcept { return category_; }
    int code() const noexcept { return code_; }
    const std::string& description() const noexcept { return description_; }

private:
    ErrorCategory category_;
    int code_;
    std::string description_;
};

// The server could not be reached during discovery.
class ConnectionError : public CdevError {
public:
    explicit ConnectionError(const std::string& cause)
        : CdevError(ErrorCategory::Connection, ErrorCodes::Connection, "Cannot Connect to Server: " + cause) {}
};

// The server answered with a body that does not have the expected shape.
class ProtocolError : public CdevError {
public:
    explicit ProtocolError(const std::string& cause)
        : CdevError(ErrorCategory::Protocol, ErrorCodes::Protocol, "Invalid Server Response: " + cause) {}
};

//==========================================================================================================
// TransportError
// Purpose: A request failed in flight (resolve/connect/read/write) or returned a non-2xx status.
// Fields:
//   status: HTTP status when a response was received.
//   body: Response body when a response was received.
//==========================================================================================================
class TransportError : public CdevError {
public:
    explicit TransportError(const std::string& cause)
        : CdevError(ErrorCategory::Transport, ErrorCodes::Transport, "Request Failed: " + cause) {}

    TransportError(int status, const std::string& reason, std::string body)
        : CdevError(ErrorCategory::Transport, ErrorCodes::Transport,
                    "Request Failed: HTTP " + std::to_string(status) + (reason.empty() ? "" : " " + reason)),
          status_(status), body_(std::move(body)) {}

    const std::optional<int>& status() const noexcept { return status_; }
    const std::optional<std::string>& body() const noexcept { return body_; }

private:
    std::optional<int> status_;
    std::optional<std::string> body_;
};

// A required field is missing or has the wrong JSON type.
class DecodeError : public CdevError {
public:
    DecodeError(const std::string& entity, const std::string& field, const std::string& problem)
        : CdevError(ErrorCategory::Decode, ErrorCodes::Decode, entity + "." + field + ": " + problem),
          entity_(entity), field_(field) {}

    const std::string& entity() const noexcept { return entity_; }
    const std::string& field() const noexcept { return field_; }

private:
    std::string entity_;
    std::string field_;
};

//==========================================================================================================
// FormatOperationErrors
// Purpose: Renders the verbatim "errors" payload of a failed operation for display.
// Args:
//   errors: Any JSON value. Strings print as-is, arrays print one entry per line, objects prefer
//           their "error"/"message" members and fall back to compact JSON.
// Returns:
//   Human-readable multi-line text (no trailing newline).
//==========================================================================================================
inline std::string FormatOperationErrors(const JSONValue& errors) {
    auto one = [](const JSONValue& v) -> std::string {
        if (std::holds_alternative<std::string>(v.value)) {
            return std::get<std::string>(v.value);
        }
        for (const char* key : {"error", "message", "text"}) {
            const JSONValue* m = v.Find(key);
            if (m && std::holds_alternative<std::string>(m->value)) {
                return std::get<std::string>(m->value);
            }
        }
        return SerializeJSON(v);
    };
    if (!std::holds_alternative<JSONValue::Array>(errors.value)) {
        return one(errors);
    }
    std::ostringstream oss;
    bool first = true;
    for (const auto& item : std::get<JSONValue::Array>(errors.value)) {
        if (!item) continue;
        if (!first) oss << '\n';
        first = false;
        oss << one(*item);
    }
    return oss.str();
}

} // namespace errors
} // namespace cdev
