/*
 * devcat - Bulk Device Category Reassignment
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <string>

#include "devcat/device_api.hpp"
#include "devcat/http.hpp"
#include "devcat/session.hpp"

namespace devcat {

// DeviceApi over the Microsoft Graph device-management endpoints.
class GraphClient final : public DeviceApi {
public:
    static constexpr const char* kDefaultBaseUrl = "https://graph.microsoft.com/beta";

    GraphClient(HttpTransport& http, Session& session, std::string baseUrl = kDefaultBaseUrl);

    GraphClient(const GraphClient&) = delete;
    GraphClient& operator=(const GraphClient&) = delete;

    [[nodiscard]] CategoryQueryResult findCategories(const std::string& displayName) override;
    [[nodiscard]] AssignResult assignCategory(const std::string& deviceId,
                                              const std::string& categoryId) override;
    [[nodiscard]] DeviceStatusResult getDevice(const std::string& deviceId) override;

    // OData string literal: wraps in single quotes, doubling embedded ones.
    [[nodiscard]] static std::string odataLiteral(const std::string& value);

private:
    // Sends with the bearer token; ok only for a received 2xx response.
    [[nodiscard]] HttpResult send(HttpRequest request, std::string& error);
    [[nodiscard]] static std::string describeFailure(const HttpResult& response);

    HttpTransport& http_;
    Session& session_;
    std::string baseUrl_;
};

}
