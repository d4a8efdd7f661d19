/*
 * loopcast - Loop Render & Publish Scheduler
 * Copyright (c) 2025 The loopcast contributors
 * SPDX-License-Identifier: MIT
 */

#include "loopcast/http.hpp"
#include "loopcast/logger.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <mutex>
#include <stdexcept>

namespace loopcast {

namespace {
constexpr const char* kUserAgent = "loopcast/0.1";

struct CurlHandle {
    CURL* h = nullptr;
    CurlHandle() { h = curl_easy_init(); }
    ~CurlHandle() { if (h) curl_easy_cleanup(h); }
};

struct HeaderList {
    curl_slist* list = nullptr;
    ~HeaderList() { if (list) curl_slist_free_all(list); }
};

std::once_flag g_curl_init;

std::string trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}
}

namespace detail {

std::size_t appendBody(char* ptr, std::size_t size, std::size_t nmemb, void* body) noexcept {
    try {
        static_cast<std::string*>(body)->append(ptr, size * nmemb);
        return size * nmemb;
    } catch (const std::exception& e) {
        LOG_ERROR("HTTP body dropped: " + std::string(e.what()));
        return 0;
    }
}

std::size_t collectHeader(char* buffer, std::size_t size, std::size_t nitems, void* headers) noexcept {
    std::size_t total = size * nitems;
    try {
        auto* map = static_cast<std::map<std::string, std::string>*>(headers);
        std::string line(buffer, total);

        // A new status line starts a new header block (redirects, 100-continue).
        if (line.rfind("HTTP/", 0) == 0) {
            map->clear();
            return total;
        }
        auto colon = line.find(':');
        if (colon == std::string::npos) {
            return total;
        }
        std::string name = line.substr(0, colon);
        std::transform(name.begin(), name.end(), name.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        (*map)[trim(name)] = trim(line.substr(colon + 1));
        return total;
    } catch (const std::exception& e) {
        LOG_ERROR("HTTP header dropped: " + std::string(e.what()));
        return 0;
    }
}

}

HttpClient::HttpClient() {
    std::call_once(g_curl_init, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

HttpResponse HttpClient::perform(const HttpRequest& request) const noexcept {
    HttpResponse response;
    try {
        CurlHandle ch;
        if (!ch.h) {
            response.error = "curl init failed";
            return response;
        }

        HeaderList hdr;
        for (const auto& h : request.headers) {
            hdr.list = curl_slist_append(hdr.list, h.c_str());
        }

        curl_easy_setopt(ch.h, CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(ch.h, CURLOPT_USERAGENT, kUserAgent);
        curl_easy_setopt(ch.h, CURLOPT_HTTPHEADER, hdr.list);
        curl_easy_setopt(ch.h, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(ch.h, CURLOPT_CONNECTTIMEOUT_MS, request.connectTimeoutMs);
        if (request.timeoutMs > 0) {
            curl_easy_setopt(ch.h, CURLOPT_TIMEOUT_MS, request.timeoutMs);
        }
        curl_easy_setopt(ch.h, CURLOPT_SSL_VERIFYPEER, 1L);
        curl_easy_setopt(ch.h, CURLOPT_SSL_VERIFYHOST, 2L);
        curl_easy_setopt(ch.h, CURLOPT_WRITEFUNCTION, detail::appendBody);
        curl_easy_setopt(ch.h, CURLOPT_WRITEDATA, &response.body);
        curl_easy_setopt(ch.h, CURLOPT_HEADERFUNCTION, detail::collectHeader);
        curl_easy_setopt(ch.h, CURLOPT_HEADERDATA, &response.headers);

        if (request.method == "GET") {
            curl_easy_setopt(ch.h, CURLOPT_HTTPGET, 1L);
        } else {
            if (request.method != "POST") {
                curl_easy_setopt(ch.h, CURLOPT_CUSTOMREQUEST, request.method.c_str());
            }
            curl_easy_setopt(ch.h, CURLOPT_POST, 1L);
            curl_easy_setopt(ch.h, CURLOPT_POSTFIELDS, request.body.data());
            curl_easy_setopt(ch.h, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(request.body.size()));
        }

        CURLcode rc = curl_easy_perform(ch.h);
        if (rc != CURLE_OK) {
            response.error = curl_easy_strerror(rc);
            return response;
        }
        curl_easy_getinfo(ch.h, CURLINFO_RESPONSE_CODE, &response.status);
        response.ok = true;
    } catch (const std::exception& e) {
        response.ok = false;
        response.error = e.what();
    }
    return response;
}

std::string urlEncode(const std::string& value) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += hex[c >> 4];
            out += hex[c & 0x0F];
        }
    }
    return out;
}

}
