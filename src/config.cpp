/*
 * devcat - Bulk Device Category Reassignment
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "devcat/config.hpp"
#include <cstdlib>

namespace devcat {

namespace {

bool parseInt(const std::string& text, int& out) {
    try {
        std::size_t idx = 0;
        int value = std::stoi(text, &idx, 10);
        if (idx != text.size()) return false;
        out = value;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

ConfigResult fail(const std::string& message) {
    ConfigResult result;
    result.error = message;
    return result;
}

struct NumberSetting {
    const char* flag;
    const char* envName;
    int minimum;
};

constexpr NumberSetting kRetries{"--retries", "DEVCAT_MAX_RETRIES", 0};
constexpr NumberSetting kInterval{"--interval", "DEVCAT_POLL_INTERVAL", 0};
constexpr NumberSetting kJobs{"--jobs", "DEVCAT_JOBS", 1};
constexpr NumberSetting kTimeout{"--timeout", "DEVCAT_HTTP_TIMEOUT", 1};

bool applyNumber(const NumberSetting& setting, const std::string& text, int& out, std::string& error,
                 bool fromEnv) {
    int value = 0;
    if (!parseInt(text, value) || value < setting.minimum) {
        error = std::string("Invalid ") + (fromEnv ? setting.envName : setting.flag) + " value '" + text +
                "' (expected an integer >= " + std::to_string(setting.minimum) + ")";
        return false;
    }
    out = value;
    return true;
}

}

ConfigResult parseArgs(const std::vector<std::string>& args, const EnvLookup& env) {
    auto lookup = [&env](const char* name) -> const char* {
        const char* value = env ? env(name) : std::getenv(name);
        return (value && *value) ? value : nullptr;
    };

    // Help and version win over everything else
    for (const auto& arg : args) {
        if (arg == "-h" || arg == "--help") {
            ConfigResult result;
            result.ok = true;
            result.action = CliAction::Help;
            return result;
        }
        if (arg == "-v" || arg == "--version") {
            ConfigResult result;
            result.ok = true;
            result.action = CliAction::Version;
            return result;
        }
    }

    Config config;
    std::string error;
    int retries = config.maxRetries;
    int interval = static_cast<int>(config.pollInterval.count());
    int jobs = config.jobs;
    int timeout = static_cast<int>(config.httpTimeout.count());

    // Environment layer
    if (const char* v = lookup(kRetries.envName)) {
        if (!applyNumber(kRetries, v, retries, error, true)) return fail(error);
    }
    if (const char* v = lookup(kInterval.envName)) {
        if (!applyNumber(kInterval, v, interval, error, true)) return fail(error);
    }
    if (const char* v = lookup(kJobs.envName)) {
        if (!applyNumber(kJobs, v, jobs, error, true)) return fail(error);
    }
    if (const char* v = lookup(kTimeout.envName)) {
        if (!applyNumber(kTimeout, v, timeout, error, true)) return fail(error);
    }
    if (const char* v = lookup("DEVCAT_ACCESS_TOKEN")) config.accessToken = v;
    if (const char* v = lookup("DEVCAT_TENANT_ID")) config.credentials.tenantId = v;
    if (const char* v = lookup("DEVCAT_CLIENT_ID")) config.credentials.clientId = v;
    if (const char* v = lookup("DEVCAT_CLIENT_SECRET")) config.credentials.clientSecret = v;
    if (const char* v = lookup("DEVCAT_GRAPH_URL")) config.graphUrl = v;
    if (const char* v = lookup("DEVCAT_AUTHORITY")) config.credentials.authority = v;

    // Flag layer
    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        auto needValue = [&](std::string& out) -> bool {
            if (i + 1 >= args.size()) {
                error = arg + " requires a value";
                return false;
            }
            out = args[++i];
            return true;
        };

        std::string value;
        if (arg == "--file" || arg == "-f") {
            if (!needValue(config.inputPath)) return fail(error);
        } else if (arg == kRetries.flag || arg == "-r") {
            if (!needValue(value) || !applyNumber(kRetries, value, retries, error, false)) return fail(error);
        } else if (arg == kInterval.flag) {
            if (!needValue(value) || !applyNumber(kInterval, value, interval, error, false)) return fail(error);
        } else if (arg == kJobs.flag || arg == "-j") {
            if (!needValue(value) || !applyNumber(kJobs, value, jobs, error, false)) return fail(error);
        } else if (arg == kTimeout.flag) {
            if (!needValue(value) || !applyNumber(kTimeout, value, timeout, error, false)) return fail(error);
        } else if (arg == "--token") {
            if (!needValue(config.accessToken)) return fail(error);
        } else if (arg == "--tenant") {
            if (!needValue(config.credentials.tenantId)) return fail(error);
        } else if (arg == "--client-id") {
            if (!needValue(config.credentials.clientId)) return fail(error);
        } else if (arg == "--graph-url") {
            if (!needValue(config.graphUrl)) return fail(error);
        } else if (arg == "--authority") {
            if (!needValue(config.credentials.authority)) return fail(error);
        } else if (arg == "-q" || arg == "--quiet") {
            config.logLevel = LogLevel::WARN;
        } else if (arg == "-V" || arg == "--verbose") {
            config.logLevel = LogLevel::DEBUG;
        } else if (!arg.empty() && arg[0] == '-') {
            return fail("Unknown option: " + arg);
        } else if (config.inputPath.empty()) {
            config.inputPath = arg;
        } else {
            return fail("Unexpected argument: " + arg);
        }
    }

    if (config.inputPath.empty()) {
        return fail("Missing input file (devcat <devices.csv>)");
    }

    if (config.accessToken.empty() && !config.credentials.complete()) {
        return fail("No credentials: set --token/DEVCAT_ACCESS_TOKEN, or DEVCAT_TENANT_ID, "
                    "DEVCAT_CLIENT_ID and DEVCAT_CLIENT_SECRET");
    }

    if (config.graphUrl.empty()) {
        return fail("Graph URL must not be empty");
    }

    config.maxRetries = retries;
    config.pollInterval = std::chrono::seconds(interval);
    config.jobs = jobs;
    config.httpTimeout = std::chrono::seconds(timeout);

    ConfigResult result;
    result.ok = true;
    result.config = std::move(config);
    return result;
}

}
