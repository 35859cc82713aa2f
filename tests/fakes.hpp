/*
 * devcat - Bulk Device Category Reassignment
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "devcat/device_api.hpp"
#include "devcat/http.hpp"

namespace devcat::test {

// Scripted in-memory device service.
class FakeDeviceApi final : public DeviceApi {
public:
    std::map<std::string, std::vector<CategoryRef>> categories;
    std::string lookupError;  // non-empty makes every lookup fail

    AssignResult assignReply{true, "", ""};

    // Per-device status replies, consumed in order; the last one repeats.
    std::map<std::string, std::deque<DeviceStatusResult>> statuses;

    CategoryQueryResult findCategories(const std::string& displayName) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++lookups;
        lookedUp.push_back(displayName);
        if (!lookupError.empty()) {
            return {false, {}, lookupError};
        }
        auto it = categories.find(displayName);
        if (it == categories.end()) {
            return {true, {}, ""};
        }
        return {true, it->second, ""};
    }

    AssignResult assignCategory(const std::string& deviceId, const std::string& categoryId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++assigns;
        assigned.emplace_back(deviceId, categoryId);
        return assignReply;
    }

    DeviceStatusResult getDevice(const std::string& deviceId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++fetches;
        ++fetchesByDevice[deviceId];
        auto it = statuses.find(deviceId);
        if (it == statuses.end() || it->second.empty()) {
            return {true, deviceId, "Unassigned", ""};
        }
        DeviceStatusResult reply = it->second.front();
        if (it->second.size() > 1) {
            it->second.pop_front();
        }
        return reply;
    }

    void addCategory(const std::string& name, const std::string& id) {
        categories[name].push_back({id, name});
    }

    void scriptStatus(const std::string& deviceId, const std::vector<std::string>& names) {
        auto& queue = statuses[deviceId];
        for (const auto& name : names) {
            queue.push_back({true, deviceId, name, ""});
        }
    }

    int lookups = 0;
    int assigns = 0;
    int fetches = 0;
    std::vector<std::string> lookedUp;
    std::vector<std::pair<std::string, std::string>> assigned;
    std::map<std::string, int> fetchesByDevice;

private:
    std::mutex mutex_;
};

// Records requests and answers them from a handler.
class FakeTransport final : public HttpTransport {
public:
    using Handler = std::function<HttpResult(const HttpRequest&)>;

    explicit FakeTransport(Handler handler = Handler()) : handler_(std::move(handler)) {}

    HttpResult perform(const HttpRequest& request) noexcept override {
        std::lock_guard<std::mutex> lock(mutex_);
        requests.push_back(request);
        if (!handler_) {
            return {true, 200, "{}", ""};
        }
        return handler_(request);
    }

    void setHandler(Handler handler) { handler_ = std::move(handler); }

    [[nodiscard]] static std::string header(const HttpRequest& request, const std::string& name) {
        for (const auto& h : request.headers) {
            if (h.first == name) return h.second;
        }
        return std::string();
    }

    std::vector<HttpRequest> requests;

private:
    Handler handler_;
    std::mutex mutex_;
};

inline HttpResult reply(long status, std::string body) {
    return {true, status, std::move(body), ""};
}

inline HttpResult transportError(std::string message) {
    return {false, 0, "", std::move(message)};
}

}
