//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvVars.h
// Purpose: Helpers to read environment variable overrides (TOOLHUB_*) safely.
//==========================================================================================================
#pragma once
#include <cerrno>
#include <cstdint>
#include <cstdlib>
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
// GetEnvUintOrDefault
// Purpose: Reads an unsigned integer override; malformed or missing values yield defaultValue.
//==========================================================================================================
inline uint64_t GetEnvUintOrDefault(const char* name, uint64_t defaultValue) {
    const std::string raw = GetEnvOrDefault(name, "");
    if (raw.empty()) {
        return defaultValue;
    }
    char* end = nullptr;
    errno = 0;
    unsigned long long v = std::strtoull(raw.c_str(), &end, 10);
    if (errno != 0 || end == raw.c_str() || *end != '\0') {
        return defaultValue;
    }
    return static_cast<uint64_t>(v);
}
