//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvVars.h
// Purpose: Helpers to read the host process environment safely.
//==========================================================================================================
#pragma once
#include <cstdint>
#include <cstdlib>
#include <map>
#include <string>

extern "C" char** environ;

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
// GetEnvUint64OrDefault
// Purpose: Reads an unsigned integer from the environment; malformed or empty values yield the default.
//==========================================================================================================
inline uint64_t GetEnvUint64OrDefault(const char* name, uint64_t defaultValue) {
    const std::string s = GetEnvOrDefault(name, "");
    if (s.empty()) {
        return defaultValue;
    }
    char* end = nullptr;
    unsigned long long v = std::strtoull(s.c_str(), &end, 10);
    if (end == s.c_str() || *end != '\0') {
        return defaultValue;
    }
    return static_cast<uint64_t>(v);
}

//==========================================================================================================
// SnapshotEnvironment
// Purpose: Copies the current process environment into an ordered name -> value map.
// Returns:
//   Map of every NAME=value entry in environ; entries without '=' are skipped.
//==========================================================================================================
inline std::map<std::string, std::string> SnapshotEnvironment() {
    std::map<std::string, std::string> out;
    if (environ == nullptr) {
        return out;
    }
    for (char** e = environ; *e != nullptr; ++e) {
        std::string entry(*e);
        std::size_t eq = entry.find('=');
        if (eq == std::string::npos || eq == 0) {
            continue;
        }
        out.emplace(entry.substr(0, eq), entry.substr(eq + 1));
    }
    return out;
}
