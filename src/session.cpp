/*
 * devcat - Bulk Device Category Reassignment
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "devcat/session.hpp"
#include "devcat/logger.hpp"
#include <nlohmann/json.hpp>

namespace devcat {

using json = nlohmann::json;

Session::Session(std::string staticToken)
    : token_(std::move(staticToken)),
      expiresAt_(std::chrono::steady_clock::time_point::max()) {
    LOG_DEBUG("Session using a supplied access token");
}

Session::Session(HttpTransport& http, Credentials credentials)
    : http_(&http), credentials_(std::move(credentials)) {
    LOG_DEBUG("Session using client credentials for tenant " + credentials_.tenantId +
              ", client " + credentials_.clientId);
}

TokenResult Session::token() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (usesStaticToken()) {
        if (token_.empty()) {
            return {false, "", "No access token configured"};
        }
        return {true, token_, ""};
    }

    if (!token_.empty() && std::chrono::steady_clock::now() + kRefreshMargin < expiresAt_) {
        return {true, token_, ""};
    }

    return acquire();
}

std::string Session::tokenEndpoint() const {
    std::string base = credentials_.authority;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    return base + "/" + urlEscape(credentials_.tenantId) + "/oauth2/v2.0/token";
}

TokenResult Session::acquire() {
    if (!credentials_.complete()) {
        return {false, "", "Incomplete client credentials (tenant, client id and secret are required)"};
    }

    LOG_INFO("Requesting access token for tenant " + credentials_.tenantId);

    HttpRequest request;
    request.method = HttpMethod::Post;
    request.url = tokenEndpoint();
    request.headers.emplace_back("Content-Type", "application/x-www-form-urlencoded");
    request.headers.emplace_back("Accept", "application/json");
    request.body = formEncode({
        {"client_id", credentials_.clientId},
        {"client_secret", credentials_.clientSecret},
        {"scope", credentials_.scope},
        {"grant_type", "client_credentials"},
    });

    HttpResult response = http_->perform(request);
    if (!response) {
        return {false, "", "Token request failed: " + response.error};
    }

    try {
        json body = json::parse(response.body);

        if (!response.isSuccess()) {
            std::string detail = body.value("error_description", body.value("error", std::string()));
            return {false, "", "Token request rejected (HTTP " + std::to_string(response.status) + ")" +
                               (detail.empty() ? std::string() : ": " + detail)};
        }

        auto token = body.value("access_token", std::string());
        if (token.empty()) {
            return {false, "", "Token response has no access_token"};
        }

        long expiresIn = 3600;
        auto it = body.find("expires_in");
        if (it != body.end()) {
            if (it->is_number_integer()) {
                expiresIn = it->get<long>();
            } else if (it->is_string()) {
                expiresIn = std::stol(it->get<std::string>());
            }
        }

        token_ = token;
        expiresAt_ = std::chrono::steady_clock::now() + std::chrono::seconds(expiresIn);
        LOG_DEBUG("Access token acquired, expires in " + std::to_string(expiresIn) + "s");
        return {true, token_, ""};
    } catch (const std::exception& e) {
        if (!response.isSuccess()) {
            return {false, "", "Token request rejected (HTTP " + std::to_string(response.status) + ")"};
        }
        return {false, "", std::string("Malformed token response: ") + e.what()};
    }
}

}
