/*
 * devcat - Bulk Device Category Reassignment
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "devcat/resolver.hpp"
#include "devcat/logger.hpp"

namespace devcat {

ResolveResult Resolver::resolve(const std::string& categoryName) {
    {
        std::lock_guard<std::mutex> lock(cacheMutex_);
        auto it = cache_.find(categoryName);
        if (it != cache_.end()) {
            LOG_TRACE("Category '" + categoryName + "' resolved from cache: " + it->second);
            return {true, it->second, ""};
        }
    }

    CategoryQueryResult query = api_.findCategories(categoryName);
    if (!query) {
        return {false, std::nullopt, query.error};
    }

    if (query.matches.empty()) {
        LOG_DEBUG("No category named '" + categoryName + "'");
        return {true, std::nullopt, ""};
    }

    if (query.matches.size() > 1) {
        LOG_WARN(std::to_string(query.matches.size()) + " categories named '" + categoryName +
                 "', using the first (" + query.matches.front().id + ")");
    }

    const std::string& id = query.matches.front().id;
    {
        std::lock_guard<std::mutex> lock(cacheMutex_);
        cache_.emplace(categoryName, id);
    }
    LOG_DEBUG("Category '" + categoryName + "' resolved to " + id);
    return {true, id, ""};
}

std::size_t Resolver::cacheSize() const {
    std::lock_guard<std::mutex> lock(cacheMutex_);
    return cache_.size();
}

}
