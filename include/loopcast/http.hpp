/*
 * loopcast - Loop Render & Publish Scheduler
 * Copyright (c) 2025 The loopcast contributors
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace loopcast {

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    std::vector<std::string> headers;   // "Name: value"
    std::string body;
    long connectTimeoutMs = 15000;
    long timeoutMs = 0;                 // 0 = no overall limit
};

struct HttpResponse {
    bool ok = false;                    // transport succeeded; status may still be an error
    long status = 0;
    std::map<std::string, std::string> headers;  // lower-case names
    std::string body;
    std::string error;
};

// Thin libcurl wrapper, one easy handle per request.
class HttpClient final {
public:
    HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    [[nodiscard]] HttpResponse perform(const HttpRequest& request) const noexcept;
};

[[nodiscard]] std::string urlEncode(const std::string& value);

namespace detail {
// libcurl write/header callbacks. A return short of size * count makes
// libcurl abort the transfer; nothing is allowed to throw into curl.
std::size_t appendBody(char* ptr, std::size_t size, std::size_t nmemb, void* body) noexcept;
std::size_t collectHeader(char* buffer, std::size_t size, std::size_t nitems, void* headers) noexcept;
}

}
