/*
 * devcat - Bulk Device Category Reassignment
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "devcat/logger.hpp"
#include "devcat/session.hpp"

namespace devcat {

struct Config {
    std::string inputPath;
    int maxRetries = 5;
    std::chrono::seconds pollInterval{10};
    int jobs = 1;
    std::chrono::seconds httpTimeout{30};

    std::string accessToken;
    Credentials credentials;
    std::string graphUrl = "https://graph.microsoft.com/beta";

    std::optional<LogLevel> logLevel;  // unset keeps DEVCAT_LOG_LEVEL / INFO
};

enum class CliAction : uint8_t { Run, Help, Version };

struct ConfigResult {
    bool ok = false;
    CliAction action = CliAction::Run;
    Config config;
    std::string error;
    explicit operator bool() const noexcept { return ok; }
};

// Returns the value of an environment variable or nullptr.
using EnvLookup = std::function<const char*(const char*)>;

// Flags override DEVCAT_* environment variables, which override defaults.
// args excludes the program name.
[[nodiscard]] ConfigResult parseArgs(const std::vector<std::string>& args,
                                     const EnvLookup& env = EnvLookup());

}
