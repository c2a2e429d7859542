//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvVars.h
// Purpose: Helpers to read cdev configuration from environment variables.
//==========================================================================================================
#pragma once
#include <cctype>
#include <cstdlib>
#include <optional>
#include <string>

//==========================================================================================================
// GetEnvOrDefault
// Purpose: Returns the value of the environment variable or a provided default when unset.
// Args:
//   name: C-string name of the environment variable. When null or empty, returns defaultValue.
//   defaultValue: Value to return when the variable is not set.
// Returns:
//   std::string with the environment value (when set) or defaultValue otherwise.
//==========================================================================================================
inline std::string GetEnvOrDefault(const char* name, const std::string& defaultValue) {
    if (name == nullptr || *name == '\0') {
        return defaultValue;
    }
    const char* v = std::getenv(name);
    return v ? std::string(v) : defaultValue;
}

//==========================================================================================================
// GetEnvOptional
// Purpose: Returns the environment value when set and non-empty, std::nullopt otherwise.
//==========================================================================================================
inline std::optional<std::string> GetEnvOptional(const std::string& name) {
    const char* v = std::getenv(name.c_str());
    if (v == nullptr || *v == '\0') {
        return std::nullopt;
    }
    return std::string(v);
}

// "1", "true", "yes", "on" (any case) are true; anything else is false. Unset yields defaultValue.
inline bool GetEnvFlag(const char* name, bool defaultValue) {
    const char* v = (name && *name) ? std::getenv(name) : nullptr;
    if (v == nullptr) {
        return defaultValue;
    }
    std::string s;
    for (const char* p = v; *p; ++p) {
        s.push_back(static_cast<char>(::tolower(static_cast<unsigned char>(*p))));
    }
    return s == "1" || s == "true" || s == "yes" || s == "on";
}
