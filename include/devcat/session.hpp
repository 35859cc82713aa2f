/*
 * devcat - Bulk Device Category Reassignment
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <mutex>
#include <string>

#include "devcat/http.hpp"

namespace devcat {

struct Credentials {
    std::string tenantId;
    std::string clientId;
    std::string clientSecret;
    std::string authority = "https://login.microsoftonline.com";
    std::string scope = "https://graph.microsoft.com/.default";

    [[nodiscard]] bool complete() const noexcept {
        return !tenantId.empty() && !clientId.empty() && !clientSecret.empty();
    }
};

struct TokenResult {
    bool ok = false;
    std::string token;
    std::string error;
    explicit operator bool() const noexcept { return ok; }
};

// Bearer-token holder shared by every remote call of a run. Either wraps a
// fixed token, or runs the OAuth2 client-credentials grant and renews the
// token shortly before it expires.
class Session final {
public:
    explicit Session(std::string staticToken);
    Session(HttpTransport& http, Credentials credentials);

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;
    Session(Session&&) = delete;
    Session& operator=(Session&&) = delete;

    // Current token, acquiring one first when none is valid.
    [[nodiscard]] TokenResult token();

    [[nodiscard]] bool usesStaticToken() const noexcept { return http_ == nullptr; }

    // Tokens closer than this to expiry are renewed.
    static constexpr std::chrono::seconds kRefreshMargin{60};

private:
    [[nodiscard]] TokenResult acquire();
    [[nodiscard]] std::string tokenEndpoint() const;

    HttpTransport* http_ = nullptr;
    Credentials credentials_;

    std::mutex mutex_;
    std::string token_;
    std::chrono::steady_clock::time_point expiresAt_{};
};

}
