/*
 * devcat - Bulk Device Category Reassignment
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "devcat/updater.hpp"
#include "devcat/logger.hpp"

namespace devcat {

UpdateResult Updater::update(const std::string& deviceId,
                             const std::string& categoryId,
                             const std::string& deviceName) {
    LOG_INFO("Updating category of " + deviceName + " (" + deviceId + ") to " + categoryId);

    AssignResult assign = api_.assignCategory(deviceId, categoryId);
    if (!assign) {
        LOG_ERROR("Category update failed for " + deviceName + " (" + deviceId + "): " + assign.error);
        return {false, false, "", assign.error};
    }

    if (!assign.body.empty()) {
        // A body on a successful write is tolerated, not treated as an error
        LOG_WARN("Unexpected response updating " + deviceName + " (" + deviceId + "): " + assign.body);
        return {true, true, assign.body, ""};
    }

    LOG_DEBUG("Category update accepted for " + deviceName + " (" + deviceId + ")");
    return {true, false, "", ""};
}

}
