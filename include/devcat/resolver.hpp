/*
 * devcat - Bulk Device Category Reassignment
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "devcat/device_api.hpp"

namespace devcat {

// ok == false is a lookup error; ok with no categoryId means no match.
struct ResolveResult {
    bool ok = false;
    std::optional<std::string> categoryId;
    std::string error;
    explicit operator bool() const noexcept { return ok; }
};

class Resolver final {
public:
    explicit Resolver(DeviceApi& api) noexcept : api_(api) {}

    Resolver(const Resolver&) = delete;
    Resolver& operator=(const Resolver&) = delete;

    // First category whose display name equals categoryName.
    // Successful lookups are remembered for the lifetime of the resolver.
    [[nodiscard]] ResolveResult resolve(const std::string& categoryName);

    [[nodiscard]] std::size_t cacheSize() const;

private:
    DeviceApi& api_;
    mutable std::mutex cacheMutex_;
    std::unordered_map<std::string, std::string> cache_;
};

}
