/*
 * devcat - Bulk Device Category Reassignment
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "devcat/http.hpp"
#include "devcat/logger.hpp"
#include <curl/curl.h>
#include <memory>

namespace devcat {

namespace {

struct EasyDeleter {
    void operator()(CURL* handle) const noexcept { curl_easy_cleanup(handle); }
};

struct SlistDeleter {
    void operator()(curl_slist* list) const noexcept { curl_slist_free_all(list); }
};

using EasyHandle = std::unique_ptr<CURL, EasyDeleter>;
using HeaderList = std::unique_ptr<curl_slist, SlistDeleter>;

size_t writeBody(char* data, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    try {
        body->append(data, size * nmemb);
    } catch (...) {
        return 0;  // aborts the transfer with CURLE_WRITE_ERROR
    }
    return size * nmemb;
}

}

const char* methodToString(HttpMethod method) noexcept {
    switch (method) {
        case HttpMethod::Get: return "GET";
        case HttpMethod::Post: return "POST";
        case HttpMethod::Put: return "PUT";
        case HttpMethod::Patch: return "PATCH";
        case HttpMethod::Delete: return "DELETE";
        default: return "GET";
    }
}

HttpResult CurlTransport::perform(const HttpRequest& request) noexcept {
    HttpResult result;

    try {
        EasyHandle curl(curl_easy_init());
        if (!curl) {
            result.error = "curl_easy_init failed";
            return result;
        }

        HeaderList headers;
        for (const auto& header : request.headers) {
            const std::string line = header.first + ": " + header.second;
            curl_slist* appended = curl_slist_append(headers.get(), line.c_str());
            if (!appended) {
                result.error = "Failed to build request headers";
                return result;
            }
            (void)headers.release();
            headers.reset(appended);
        }

        char errbuf[CURL_ERROR_SIZE] = {0};

        curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, errbuf);
        curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, static_cast<long>(timeout_.count()));
        curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 0L);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &writeBody);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &result.body);
        if (headers) {
            curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
        }

        switch (request.method) {
            case HttpMethod::Get:
                curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
                break;
            case HttpMethod::Post:
                curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
                break;
            default:
                curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, methodToString(request.method));
                break;
        }
        if (request.method != HttpMethod::Get) {
            curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, request.body.c_str());
            curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE_LARGE,
                             static_cast<curl_off_t>(request.body.size()));
        }

        LOG_TRACE(std::string("HTTP ") + methodToString(request.method) + " " + request.url);

        CURLcode rc = curl_easy_perform(curl.get());
        if (rc != CURLE_OK) {
            result.error = errbuf[0] != '\0' ? std::string(errbuf) : std::string(curl_easy_strerror(rc));
            result.body.clear();
            return result;
        }

        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &result.status);
        result.ok = true;

        LOG_TRACE("HTTP status " + std::to_string(result.status) + ", " +
                  std::to_string(result.body.size()) + " bytes");
    } catch (const std::exception& e) {
        result = HttpResult{};
        result.error = std::string("HTTP request failed: ") + e.what();
    }

    return result;
}

CurlGlobal::CurlGlobal() {
    ok_ = curl_global_init(CURL_GLOBAL_DEFAULT) == CURLE_OK;
    if (!ok_) {
        LOG_ERROR("curl_global_init failed");
    }
}

CurlGlobal::~CurlGlobal() {
    if (ok_) {
        curl_global_cleanup();
    }
}

std::string urlEscape(const std::string& value) {
    char* escaped = curl_easy_escape(nullptr, value.c_str(), static_cast<int>(value.size()));
    if (!escaped) {
        return std::string();
    }
    std::string out(escaped);
    curl_free(escaped);
    return out;
}

std::string formEncode(const std::vector<std::pair<std::string, std::string>>& fields) {
    std::string out;
    for (const auto& field : fields) {
        if (!out.empty()) out += '&';
        out += urlEscape(field.first);
        out += '=';
        out += urlEscape(field.second);
    }
    return out;
}

}
