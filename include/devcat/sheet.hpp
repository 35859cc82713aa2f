/*
 * devcat - Bulk Device Category Reassignment
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <istream>
#include <string>
#include <vector>

#include "devcat/types.hpp"

namespace devcat {

struct LoadResult {
    bool ok = false;
    std::vector<DeviceRecord> records;
    std::string error;
    explicit operator bool() const noexcept { return ok; }
};

// Reads the device spreadsheet (CSV with a header row naming
// DeviceID, DeviceName and NewCategory in any order).
class Sheet final {
public:
    static constexpr const char* kDeviceIdColumn = "DeviceID";
    static constexpr const char* kDeviceNameColumn = "DeviceName";
    static constexpr const char* kNewCategoryColumn = "NewCategory";

    [[nodiscard]] static LoadResult load(const std::filesystem::path& path);
    [[nodiscard]] static LoadResult parse(std::istream& in, const std::string& sourceName);

    // Splits one CSV line; false on an unterminated quote.
    [[nodiscard]] static bool splitLine(const std::string& line,
                                        std::vector<std::string>& out,
                                        std::string& error);
};

}
