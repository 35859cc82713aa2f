/*
 * devcat - Bulk Device Category Reassignment
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "devcat/reassigner.hpp"
#include "devcat/logger.hpp"
#include "devcat/pool.hpp"
#include <algorithm>

namespace devcat {

namespace {

std::string describe(const DeviceRecord& record) {
    std::string text = "'" + record.deviceName + "' (" + record.deviceId + ")";
    if (record.line > 0) {
        text += " [line " + std::to_string(record.line) + "]";
    }
    return text;
}

void logOutcome(const DeviceResult& result) {
    const std::string line = std::string(outcomeToString(result.outcome)) + ": " +
                             describe(result.record) + " -> '" + result.record.newCategory + "'" +
                             (result.message.empty() ? std::string() : " - " + result.message);
    switch (result.outcome) {
        case UpdateOutcome::Success:
            LOG_INFO(line);
            break;
        case UpdateOutcome::Failed:
            LOG_ERROR(line);
            break;
        default:
            LOG_WARN(line);
            break;
    }
}

}

DeviceResult Reassigner::process(const DeviceRecord& input, int maxRetries) noexcept {
    DeviceResult result;

    try {
        result.record.deviceId = trim(input.deviceId);
        result.record.deviceName = trim(input.deviceName);
        result.record.newCategory = trim(input.newCategory);
        result.record.line = input.line;
        const DeviceRecord& record = result.record;

        // Step 1: validate
        if (record.deviceId.empty() || record.deviceName.empty() || record.newCategory.empty()) {
            result.outcome = UpdateOutcome::Skipped;
            result.message = "missing DeviceID, DeviceName or NewCategory";
            logOutcome(result);
            return result;
        }

        // Step 2: resolve the category name
        ResolveResult resolved = resolver_.resolve(record.newCategory);
        if (!resolved) {
            result.outcome = UpdateOutcome::Failed;
            result.message = "category lookup failed: " + resolved.error;
            logOutcome(result);
            return result;
        }
        if (!resolved.categoryId) {
            result.outcome = UpdateOutcome::Skipped;
            result.message = "category not found";
            logOutcome(result);
            return result;
        }
        result.categoryId = *resolved.categoryId;

        // Step 3: write
        UpdateResult updated = updater_.update(record.deviceId, result.categoryId, record.deviceName);
        if (!updated) {
            result.outcome = UpdateOutcome::Failed;
            result.message = "update failed: " + updated.error;
            logOutcome(result);
            return result;
        }

        // Step 4: confirm
        VerifyResult verified = verifier_.verify(record.deviceId, record.newCategory, maxRetries);
        switch (verified.status) {
            case VerifyStatus::Confirmed:
                result.outcome = UpdateOutcome::Success;
                result.message = verified.fetches > 1
                    ? "confirmed after " + std::to_string(verified.fetches) + " checks"
                    : "confirmed";
                break;
            case VerifyStatus::TimedOut:
                result.outcome = UpdateOutcome::TimedOut;
                result.message = "not confirmed after " + std::to_string(verified.fetches) +
                                 " checks (last seen '" + verified.lastSeen + "'), check manually";
                break;
            case VerifyStatus::Skipped:
                if (updated.unexpected) {
                    result.outcome = UpdateOutcome::UnexpectedResponse;
                    result.message = "update returned: " + updated.body;
                } else {
                    result.outcome = UpdateOutcome::Success;
                    result.message = "not verified";
                }
                break;
        }
    } catch (const std::exception& e) {
        result.outcome = UpdateOutcome::Failed;
        result.message = std::string("internal error: ") + e.what();
    }

    logOutcome(result);
    return result;
}

Summary Reassigner::run(const std::vector<DeviceRecord>& records, int maxRetries, int jobs) {
    Summary summary;
    summary.results.resize(records.size());

    LOG_INFO("Processing " + std::to_string(records.size()) + " device(s), verification retries: " +
             std::to_string(maxRetries));

    if (jobs <= 1 || records.size() <= 1) {
        for (std::size_t i = 0; i < records.size(); ++i) {
            summary.results[i] = process(records[i], maxRetries);
        }
    } else {
        const int workers = static_cast<int>(std::min<std::size_t>(static_cast<std::size_t>(jobs), records.size()));
        Pool pool(workers);
        // Each slot is written by exactly one worker
        if (!pool.start([&](std::size_t task, int) {
                summary.results[task] = process(records[task], maxRetries);
            })) {
            LOG_WARN("Worker pool unavailable, processing sequentially");
            for (std::size_t i = 0; i < records.size(); ++i) {
                summary.results[i] = process(records[i], maxRetries);
            }
        } else {
            std::vector<std::size_t> rejected;
            for (std::size_t i = 0; i < records.size(); ++i) {
                if (!pool.submit(i)) {
                    rejected.push_back(i);
                }
            }
            pool.waitIdle();
            pool.stop();
            for (std::size_t i : rejected) {
                summary.results[i] = process(records[i], maxRetries);
            }
        }
    }

    for (const auto& result : summary.results) {
        summary.add(result.outcome);
    }

    LOG_INFO("Done: " + std::to_string(summary.succeeded) + " succeeded, " +
             std::to_string(summary.unexpected) + " unexpected, " +
             std::to_string(summary.skipped) + " skipped, " +
             std::to_string(summary.failed) + " failed, " +
             std::to_string(summary.timedOut) + " timed out");
    return summary;
}

}
