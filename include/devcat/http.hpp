/*
 * devcat - Bulk Device Category Reassignment
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace devcat {

enum class HttpMethod : uint8_t { Get, Post, Put, Patch, Delete };

[[nodiscard]] const char* methodToString(HttpMethod method) noexcept;

struct HttpRequest {
    HttpMethod method = HttpMethod::Get;
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;
};

// ok means a response was received, whatever its status.
struct HttpResult {
    bool ok = false;
    long status = 0;
    std::string body;
    std::string error;

    explicit operator bool() const noexcept { return ok; }
    [[nodiscard]] bool isSuccess() const noexcept { return ok && status >= 200 && status < 300; }
};

class HttpTransport {
public:
    virtual ~HttpTransport() = default;
    [[nodiscard]] virtual HttpResult perform(const HttpRequest& request) noexcept = 0;
};

// libcurl-backed transport. Each request uses its own easy handle, so one
// instance may be shared across threads. curl_global_init must have run.
class CurlTransport final : public HttpTransport {
public:
    explicit CurlTransport(std::chrono::seconds timeout = std::chrono::seconds(30)) noexcept
        : timeout_(timeout) {}

    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;

    [[nodiscard]] HttpResult perform(const HttpRequest& request) noexcept override;

private:
    std::chrono::seconds timeout_;
};

// RAII wrapper around curl_global_init/curl_global_cleanup.
class CurlGlobal final {
public:
    CurlGlobal();
    ~CurlGlobal();

    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;

    [[nodiscard]] bool ok() const noexcept { return ok_; }

private:
    bool ok_ = false;
};

// Percent-encodes everything outside the RFC 3986 unreserved set.
[[nodiscard]] std::string urlEscape(const std::string& value);

// Renders "k1=v1&k2=v2" with both sides escaped.
[[nodiscard]] std::string formEncode(const std::vector<std::pair<std::string, std::string>>& fields);

}
