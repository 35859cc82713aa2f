/*
 * devcat - Bulk Device Category Reassignment
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "devcat/graph_client.hpp"
#include "devcat/logger.hpp"
#include "devcat/types.hpp"
#include <nlohmann/json.hpp>

namespace devcat {

using json = nlohmann::json;

namespace {

constexpr std::size_t kMaxErrorBody = 300;

std::string stripTrailingSlash(std::string url) {
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url;
}

// Graph puts the reason under error.message
std::string graphErrorMessage(const std::string& body) {
    try {
        json parsed = json::parse(body);
        auto it = parsed.find("error");
        if (it != parsed.end() && it->is_object()) {
            std::string code = it->value("code", std::string());
            std::string message = it->value("message", std::string());
            if (!code.empty() && !message.empty()) return code + ": " + message;
            if (!message.empty()) return message;
            return code;
        }
    } catch (const json::exception&) {
        // Not JSON, fall through to the raw body
    }
    if (body.size() > kMaxErrorBody) {
        return body.substr(0, kMaxErrorBody) + "...";
    }
    return body;
}

}

GraphClient::GraphClient(HttpTransport& http, Session& session, std::string baseUrl)
    : http_(http), session_(session), baseUrl_(stripTrailingSlash(std::move(baseUrl))) {
    LOG_DEBUG("Graph client created for " + baseUrl_);
}

std::string GraphClient::odataLiteral(const std::string& value) {
    std::string out;
    out.reserve(value.size() + 2);
    out.push_back('\'');
    for (char c : value) {
        if (c == '\'') out.push_back('\'');
        out.push_back(c);
    }
    out.push_back('\'');
    return out;
}

std::string GraphClient::describeFailure(const HttpResult& response) {
    if (!response.ok) {
        return response.error;
    }
    std::string detail = graphErrorMessage(response.body);
    return "HTTP " + std::to_string(response.status) + (detail.empty() ? std::string() : ": " + detail);
}

HttpResult GraphClient::send(HttpRequest request, std::string& error) {
    TokenResult token = session_.token();
    if (!token) {
        error = "Authentication failed: " + token.error;
        return HttpResult{};
    }

    request.headers.emplace_back("Authorization", "Bearer " + token.token);
    request.headers.emplace_back("Accept", "application/json");
    if (!request.body.empty()) {
        request.headers.emplace_back("Content-Type", "application/json");
    }

    HttpResult response = http_.perform(request);
    if (!response.isSuccess()) {
        error = describeFailure(response);
    }
    return response;
}

CategoryQueryResult GraphClient::findCategories(const std::string& displayName) {
    CategoryQueryResult result;

    HttpRequest request;
    request.method = HttpMethod::Get;
    request.url = baseUrl_ + "/deviceManagement/deviceCategories?$filter=" +
                  urlEscape("displayName eq " + odataLiteral(displayName));

    std::string error;
    HttpResult response = send(std::move(request), error);
    if (!response.isSuccess()) {
        result.error = error;
        return result;
    }

    try {
        json body = json::parse(response.body);
        const json& values = body.at("value");
        if (!values.is_array()) {
            result.error = "Malformed category lookup response: value is not an array";
            return result;
        }
        for (const auto& item : values) {
            CategoryRef ref;
            ref.id = item.at("id").get<std::string>();
            ref.displayName = item.value("displayName", std::string());
            result.matches.push_back(std::move(ref));
        }
        result.ok = true;
    } catch (const json::exception& e) {
        result.matches.clear();
        result.error = std::string("Malformed category lookup response: ") + e.what();
    }

    return result;
}

AssignResult GraphClient::assignCategory(const std::string& deviceId, const std::string& categoryId) {
    AssignResult result;

    HttpRequest request;
    request.method = HttpMethod::Put;
    request.url = baseUrl_ + "/deviceManagement/managedDevices/" + urlEscape(deviceId) +
                  "/deviceCategory/$ref";
    json body = {
        {"@odata.id", baseUrl_ + "/deviceManagement/deviceCategories/" + urlEscape(categoryId)},
    };
    request.body = body.dump();

    std::string error;
    HttpResult response = send(std::move(request), error);
    if (!response.isSuccess()) {
        result.error = error;
        return result;
    }

    result.ok = true;
    result.body = trim(response.body);
    return result;
}

DeviceStatusResult GraphClient::getDevice(const std::string& deviceId) {
    DeviceStatusResult result;

    HttpRequest request;
    request.method = HttpMethod::Get;
    request.url = baseUrl_ + "/deviceManagement/managedDevices/" + urlEscape(deviceId) +
                  "?$select=id,deviceCategoryDisplayName";

    std::string error;
    HttpResult response = send(std::move(request), error);
    if (!response.isSuccess()) {
        result.error = error;
        return result;
    }

    try {
        json body = json::parse(response.body);
        result.id = body.value("id", deviceId);
        auto it = body.find("deviceCategoryDisplayName");
        if (it != body.end() && it->is_string()) {
            result.categoryName = it->get<std::string>();
        }
        result.ok = true;
    } catch (const json::exception& e) {
        result.error = std::string("Malformed device response: ") + e.what();
    }

    return result;
}

}
