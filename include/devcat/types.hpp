/*
 * devcat - Bulk Device Category Reassignment
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace devcat {

// One spreadsheet row.
struct DeviceRecord {
    std::string deviceId;
    std::string deviceName;
    std::string newCategory;
    std::size_t line = 0;  // 1-based line in the source file, 0 if not from a file
};

// Final per-device outcome.
enum class UpdateOutcome : std::uint8_t { Success, UnexpectedResponse, Failed, Skipped, TimedOut };

[[nodiscard]] const char* outcomeToString(UpdateOutcome outcome) noexcept;

// Strips leading and trailing whitespace.
[[nodiscard]] std::string trim(const std::string& value);

struct DeviceResult {
    DeviceRecord record;
    UpdateOutcome outcome = UpdateOutcome::Skipped;
    std::string categoryId;
    std::string message;
};

struct Summary {
    std::size_t succeeded = 0;
    std::size_t unexpected = 0;
    std::size_t skipped = 0;
    std::size_t failed = 0;
    std::size_t timedOut = 0;
    std::vector<DeviceResult> results;  // input order

    void add(UpdateOutcome outcome) noexcept;
    [[nodiscard]] std::size_t total() const noexcept {
        return succeeded + unexpected + skipped + failed + timedOut;
    }
    [[nodiscard]] bool hasFailures() const noexcept { return failed > 0 || timedOut > 0; }
};

}
