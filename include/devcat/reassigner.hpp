/*
 * devcat - Bulk Device Category Reassignment
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <vector>

#include "devcat/resolver.hpp"
#include "devcat/types.hpp"
#include "devcat/updater.hpp"
#include "devcat/verifier.hpp"

namespace devcat {

// Runs resolve -> update -> verify for every row and tallies the outcomes.
class Reassigner final {
public:
    Reassigner(Resolver& resolver, Updater& updater, Verifier& verifier) noexcept
        : resolver_(resolver), updater_(updater), verifier_(verifier) {}

    Reassigner(const Reassigner&) = delete;
    Reassigner& operator=(const Reassigner&) = delete;

    // With jobs > 1 devices are processed on a worker pool; results keep
    // the order of records either way.
    [[nodiscard]] Summary run(const std::vector<DeviceRecord>& records, int maxRetries, int jobs = 1);

    // One device, producing exactly one logged outcome.
    [[nodiscard]] DeviceResult process(const DeviceRecord& record, int maxRetries) noexcept;

private:
    Resolver& resolver_;
    Updater& updater_;
    Verifier& verifier_;
};

}
