/*
 * devcat - Bulk device category reassignment tool
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "devcat/config.hpp"
#include "devcat/graph_client.hpp"
#include "devcat/http.hpp"
#include "devcat/logger.hpp"
#include "devcat/reassigner.hpp"
#include "devcat/session.hpp"
#include "devcat/sheet.hpp"
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace devcat;

constexpr const char* VERSION = "0.1.0";

// Exit codes
constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitIncomplete = 2;

void printUsage(const char* progName) {
    std::cout << "devcat - Bulk Device Category Reassignment v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " <devices.csv> [options]\n";
    std::cout << "       " << progName << " --help | --version\n\n";
    std::cout << "Arguments:\n";
    std::cout << "  devices.csv       CSV with a header row naming DeviceID, DeviceName, NewCategory\n\n";
    std::cout << "Options:\n";
    std::cout << "  -r, --retries N     Verification retries per device, 0 disables (default 5)\n";
    std::cout << "  --interval SEC      Seconds between verification checks (default 10)\n";
    std::cout << "  -j, --jobs N        Devices processed in parallel (default 1)\n";
    std::cout << "  --timeout SEC       HTTP request timeout (default 30)\n";
    std::cout << "  --token TOKEN       Use this bearer token instead of client credentials\n";
    std::cout << "  --tenant ID         Directory (tenant) id for client credentials\n";
    std::cout << "  --client-id ID      Application (client) id for client credentials\n";
    std::cout << "  --graph-url URL     Graph base URL (default https://graph.microsoft.com/beta)\n";
    std::cout << "  --authority URL     Token authority (default https://login.microsoftonline.com)\n";
    std::cout << "  -q, --quiet         Only log warnings and errors\n";
    std::cout << "  -V, --verbose       Debug logging\n";
    std::cout << "  -h, --help          Show this help message\n";
    std::cout << "  -v, --version       Show version\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  DEVCAT_ACCESS_TOKEN, DEVCAT_TENANT_ID, DEVCAT_CLIENT_ID, DEVCAT_CLIENT_SECRET\n";
    std::cout << "  DEVCAT_MAX_RETRIES, DEVCAT_POLL_INTERVAL, DEVCAT_JOBS, DEVCAT_HTTP_TIMEOUT\n";
    std::cout << "  DEVCAT_GRAPH_URL, DEVCAT_AUTHORITY\n";
    std::cout << "  DEVCAT_LOG_LEVEL    Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n\n";
    std::cout << "Exit status:\n";
    std::cout << "  0  every device succeeded or was skipped\n";
    std::cout << "  1  usage, configuration, input or authentication error\n";
    std::cout << "  2  at least one device failed or timed out\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << progName << " devices.csv\n";
    std::cout << "  " << progName << " devices.csv --retries 0\n";
    std::cout << "  DEVCAT_LOG_LEVEL=DEBUG " << progName << " devices.csv --jobs 4\n";
}

void printSummary(std::ostream& os, const Summary& summary) {
    for (const auto& result : summary.results) {
        if (result.outcome == UpdateOutcome::Success) continue;
        os << outcomeToString(result.outcome) << "\t" << result.record.deviceId << "\t"
           << result.record.deviceName << "\t" << result.record.newCategory << "\t"
           << result.message << "\n";
    }
    os << "succeeded:  " << summary.succeeded << "\n";
    os << "unexpected: " << summary.unexpected << "\n";
    os << "skipped:    " << summary.skipped << "\n";
    os << "failed:     " << summary.failed << "\n";
    os << "timed out:  " << summary.timedOut << "\n";
    os << "total:      " << summary.total() << "\n";
}

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);

    try {
        ConfigResult parsed = parseArgs(args);
        if (!parsed) {
            std::cerr << "Error: " << parsed.error << "\n\n";
            printUsage(argv[0]);
            return kExitError;
        }
        if (parsed.action == CliAction::Help) {
            printUsage(argv[0]);
            return kExitOk;
        }
        if (parsed.action == CliAction::Version) {
            std::cout << VERSION << "\n";
            return kExitOk;
        }

        const Config& config = parsed.config;
        if (config.logLevel) {
            Logger::setLevel(*config.logLevel);
        } else {
            Logger::initFromEnv();
        }
        setThreadName("Main");

        // A bad sheet aborts before any remote call
        LoadResult sheet = Sheet::load(config.inputPath);
        if (!sheet) {
            LOG_ERROR("Cannot load device sheet: " + sheet.error);
            std::cerr << "Error: " << sheet.error << std::endl;
            return kExitError;
        }
        LOG_INFO("Loaded " + std::to_string(sheet.records.size()) + " device(s) from " + config.inputPath);

        CurlGlobal curl;
        if (!curl.ok()) {
            std::cerr << "Error: failed to initialize libcurl" << std::endl;
            return kExitError;
        }

        CurlTransport http(config.httpTimeout);
        std::unique_ptr<Session> session;
        if (!config.accessToken.empty()) {
            session = std::make_unique<Session>(config.accessToken);
        } else {
            session = std::make_unique<Session>(http, config.credentials);
        }

        // Authenticate once up front so a bad credential fails fast
        TokenResult token = session->token();
        if (!token) {
            LOG_ERROR("Authentication failed: " + token.error);
            std::cerr << "Error: authentication failed: " << token.error << std::endl;
            return kExitError;
        }

        GraphClient graph(http, *session, config.graphUrl);
        Resolver resolver(graph);
        Updater updater(graph);
        Verifier verifier(graph, std::chrono::duration_cast<std::chrono::milliseconds>(config.pollInterval));
        Reassigner reassigner(resolver, updater, verifier);

        Summary summary = reassigner.run(sheet.records, config.maxRetries, config.jobs);
        printSummary(std::cout, summary);

        return summary.hasFailures() ? kExitIncomplete : kExitOk;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return kExitError;
    }
}
