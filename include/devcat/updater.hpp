/*
 * devcat - Bulk Device Category Reassignment
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <string>

#include "devcat/device_api.hpp"

namespace devcat {

struct UpdateResult {
    bool ok = false;
    bool unexpected = false;  // write accepted but the acknowledgment had a body
    std::string body;
    std::string error;
    explicit operator bool() const noexcept { return ok; }
};

class Updater final {
public:
    explicit Updater(DeviceApi& api) noexcept : api_(api) {}

    Updater(const Updater&) = delete;
    Updater& operator=(const Updater&) = delete;

    // Issues exactly one association write. deviceName is only used for logging.
    [[nodiscard]] UpdateResult update(const std::string& deviceId,
                                      const std::string& categoryId,
                                      const std::string& deviceName);

private:
    DeviceApi& api_;
};

}
