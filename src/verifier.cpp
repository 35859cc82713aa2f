/*
 * devcat - Bulk Device Category Reassignment
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "devcat/verifier.hpp"
#include "devcat/logger.hpp"
#include <thread>

namespace devcat {

Verifier::Verifier(DeviceApi& api, std::chrono::milliseconds interval, SleepFn sleep)
    : api_(api), interval_(interval), sleep_(std::move(sleep)) {
    if (!sleep_) {
        sleep_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
}

VerifyResult Verifier::verify(const std::string& deviceId,
                              const std::string& expectedCategory,
                              int maxRetries) {
    VerifyResult result;

    if (maxRetries <= 0) {
        LOG_DEBUG("Verification skipped for " + deviceId);
        result.status = VerifyStatus::Skipped;
        return result;
    }

    int retries = 0;
    while (true) {
        DeviceStatusResult current = api_.getDevice(deviceId);
        ++result.fetches;

        if (current) {
            result.lastSeen = current.categoryName;
            if (current.categoryName == expectedCategory) {
                LOG_DEBUG("Device " + deviceId + " reports category '" + expectedCategory +
                          "' after " + std::to_string(result.fetches) + " fetch(es)");
                result.status = VerifyStatus::Confirmed;
                return result;
            }
            LOG_DEBUG("Device " + deviceId + " still reports '" + current.categoryName +
                      "' (attempt " + std::to_string(retries + 1) + "/" +
                      std::to_string(static_cast<long long>(maxRetries) + 1) + ")");
        } else {
            LOG_WARN("Status check failed for " + deviceId + ": " + current.error);
        }

        if (retries >= maxRetries) {
            break;
        }

        sleep_(interval_);
        ++result.waits;
        ++retries;
    }

    result.status = VerifyStatus::TimedOut;
    return result;
}

}
