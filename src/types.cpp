/*
 * devcat - Bulk Device Category Reassignment
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "devcat/types.hpp"
#include <cctype>

namespace devcat {

const char* outcomeToString(UpdateOutcome outcome) noexcept {
    switch (outcome) {
        case UpdateOutcome::Success: return "SUCCESS";
        case UpdateOutcome::UnexpectedResponse: return "UNEXPECTED";
        case UpdateOutcome::Failed: return "FAILED";
        case UpdateOutcome::Skipped: return "SKIPPED";
        case UpdateOutcome::TimedOut: return "TIMED OUT";
        default: return "UNKNOWN";
    }
}

std::string trim(const std::string& value) {
    std::size_t start = 0;
    while (start < value.size() && std::isspace(static_cast<unsigned char>(value[start]))) ++start;
    std::size_t end = value.size();
    while (end > start && std::isspace(static_cast<unsigned char>(value[end - 1]))) --end;
    return value.substr(start, end - start);
}

void Summary::add(UpdateOutcome outcome) noexcept {
    switch (outcome) {
        case UpdateOutcome::Success: ++succeeded; break;
        case UpdateOutcome::UnexpectedResponse: ++unexpected; break;
        case UpdateOutcome::Failed: ++failed; break;
        case UpdateOutcome::Skipped: ++skipped; break;
        case UpdateOutcome::TimedOut: ++timedOut; break;
    }
}

}
