/*
 * devcat - Bulk Device Category Reassignment
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <string>
#include <vector>

namespace devcat {

struct CategoryRef {
    std::string id;
    std::string displayName;
};

struct CategoryQueryResult {
    bool ok = false;
    std::vector<CategoryRef> matches;  // in the order the service returned them
    std::string error;
    explicit operator bool() const noexcept { return ok; }
};

struct AssignResult {
    bool ok = false;
    std::string body;  // acknowledgment body, empty on a clean write
    std::string error;
    explicit operator bool() const noexcept { return ok; }
};

struct DeviceStatusResult {
    bool ok = false;
    std::string id;
    std::string categoryName;
    std::string error;
    explicit operator bool() const noexcept { return ok; }
};

// Remote operations of the device-management service. Implementations
// must be safe to call from several worker threads at once.
class DeviceApi {
public:
    virtual ~DeviceApi() = default;

    // Categories whose display name equals displayName exactly.
    [[nodiscard]] virtual CategoryQueryResult findCategories(const std::string& displayName) = 0;

    // Associates the device with the category (single write, no retry).
    [[nodiscard]] virtual AssignResult assignCategory(const std::string& deviceId,
                                                      const std::string& categoryId) = 0;

    [[nodiscard]] virtual DeviceStatusResult getDevice(const std::string& deviceId) = 0;
};

}
