/*
 * devcat - Bulk Device Category Reassignment
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

#include "devcat/device_api.hpp"

namespace devcat {

enum class VerifyStatus : uint8_t { Confirmed, Skipped, TimedOut };

struct VerifyResult {
    VerifyStatus status = VerifyStatus::Skipped;
    int fetches = 0;
    int waits = 0;
    std::string lastSeen;  // category reported by the last successful fetch
};

using SleepFn = std::function<void(std::chrono::milliseconds)>;

// Polls a device until its category reads back as expected.
class Verifier final {
public:
    static constexpr std::chrono::milliseconds kDefaultInterval{10000};

    explicit Verifier(DeviceApi& api,
                      std::chrono::milliseconds interval = kDefaultInterval,
                      SleepFn sleep = SleepFn());

    Verifier(const Verifier&) = delete;
    Verifier& operator=(const Verifier&) = delete;

    // maxRetries <= 0 skips verification without fetching. Otherwise fetches
    // at least once and at most maxRetries + 1 times, waiting the fixed
    // interval between fetches.
    [[nodiscard]] VerifyResult verify(const std::string& deviceId,
                                      const std::string& expectedCategory,
                                      int maxRetries);

private:
    DeviceApi& api_;
    std::chrono::milliseconds interval_;
    SleepFn sleep_;
};

}
