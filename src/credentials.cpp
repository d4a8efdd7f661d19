/*
 * loopcast - Loop Render & Publish Scheduler
 * Copyright (c) 2025 The loopcast contributors
 * SPDX-License-Identifier: MIT
 */

#include "loopcast/credentials.hpp"
#include "loopcast/http.hpp"
#include "loopcast/logger.hpp"

#include <nlohmann/json.hpp>

#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <unistd.h>

namespace loopcast {

using json = nlohmann::json;

namespace {
constexpr const char* kDefaultTokenUri = "https://oauth2.googleapis.com/token";
// Refresh slightly early so a token never expires between chunks.
constexpr auto kExpirySlack = std::chrono::seconds(120);

std::optional<json> loadJson(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return std::nullopt;
    }
    return json::parse(file);
}

bool saveJsonAtomic(const std::filesystem::path& path, const json& doc) {
    auto temp = path;
    temp += ".tmp." + std::to_string(::getpid());
    {
        std::ofstream file(temp, std::ios::trunc);
        if (!file) return false;
        file << doc.dump(2);
        file.flush();
        if (!file.good()) return false;
    }
    std::error_code ec;
    std::filesystem::rename(temp, path, ec);
    return !ec;
}

// "installed" or "web" client block of a client secrets file.
json clientBlock(const json& secrets) {
    if (secrets.contains("installed")) return secrets.at("installed");
    if (secrets.contains("web")) return secrets.at("web");
    return secrets;
}
}

std::optional<TimePoint> parseUtcTimestamp(const std::string& text) {
    std::tm tm{};
    std::istringstream in(text);
    in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (in.fail()) {
        return std::nullopt;
    }
    std::time_t t = timegm(&tm);
    if (t == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return Clock::from_time_t(t);
}

std::string formatUtcTimestamp(TimePoint tp) {
    auto time = Clock::to_time_t(tp);
    std::tm utc{};
    gmtime_r(&time, &utc);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return buf;
}

TokenFileSessionProvider::TokenFileSessionProvider(const HttpClient& http,
                                                   std::filesystem::path tokenFile,
                                                   std::filesystem::path secretsFile)
    : http_(http), tokenFile_(std::move(tokenFile)), secretsFile_(std::move(secretsFile)) {
}

SessionResult TokenFileSessionProvider::acquire() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        auto now = Clock::now();
        if (cached_ && cached_->expiresAt > now + kExpirySlack) {
            return {true, *cached_, ""};
        }

        auto token = loadJson(tokenFile_);
        if (!token) {
            if (!std::filesystem::exists(secretsFile_)) {
                return {false, {}, "Missing " + secretsFile_.string() + ". Cannot authenticate."};
            }
            return {false, {}, "No authorized token at " + tokenFile_.string() +
                               ". Complete the authorization flow first. Cannot authenticate."};
        }

        Session session;
        session.accessToken = token->value("token", "");
        if (auto expiry = parseUtcTimestamp(token->value("expiry", ""))) {
            session.expiresAt = *expiry;
        }
        if (!session.accessToken.empty() && session.expiresAt > now + kExpirySlack) {
            cached_ = session;
            return {true, session, ""};
        }

        std::string refreshToken = token->value("refresh_token", "");
        if (refreshToken.empty()) {
            return {false, {}, "Token expired and no refresh token available. Cannot authenticate."};
        }

        std::string clientId = token->value("client_id", "");
        std::string clientSecret = token->value("client_secret", "");
        std::string tokenUri = token->value("token_uri", "");
        if (clientId.empty() || clientSecret.empty()) {
            auto secrets = loadJson(secretsFile_);
            if (!secrets) {
                return {false, {}, "Token has no client credentials and " + secretsFile_.string() +
                                   " is missing. Cannot authenticate."};
            }
            json client = clientBlock(*secrets);
            clientId = client.value("client_id", clientId);
            clientSecret = client.value("client_secret", clientSecret);
            if (tokenUri.empty()) tokenUri = client.value("token_uri", "");
        }
        if (tokenUri.empty()) {
            tokenUri = kDefaultTokenUri;
        }

        HttpRequest request;
        request.method = "POST";
        request.url = tokenUri;
        request.headers = {"Content-Type: application/x-www-form-urlencoded"};
        request.body = "client_id=" + urlEncode(clientId) +
                       "&client_secret=" + urlEncode(clientSecret) +
                       "&refresh_token=" + urlEncode(refreshToken) +
                       "&grant_type=refresh_token";
        request.timeoutMs = 30000;

        LOG_INFO("Refreshing access token");
        HttpResponse response = http_.perform(request);
        if (!response.ok) {
            return {false, {}, "Token refresh failed: " + response.error + ". Cannot authenticate."};
        }
        if (response.status != 200) {
            return {false, {}, "Token refresh rejected (HTTP " + std::to_string(response.status) +
                               "): " + response.body.substr(0, 200) + ". Cannot authenticate."};
        }

        json refreshed = json::parse(response.body);
        session.accessToken = refreshed.at("access_token").get<std::string>();
        session.expiresAt = now + std::chrono::seconds(refreshed.value("expires_in", 3600));

        (*token)["token"] = session.accessToken;
        (*token)["expiry"] = formatUtcTimestamp(session.expiresAt);
        if (!saveJsonAtomic(tokenFile_, *token)) {
            LOG_WARN("Could not persist refreshed token to " + tokenFile_.string());
        }

        cached_ = session;
        return {true, session, ""};
    } catch (const std::exception& e) {
        return {false, {}, "Credential error: " + std::string(e.what()) + ". Cannot authenticate."};
    }
}

}
