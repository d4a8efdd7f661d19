/*
 * loopcast - Loop Render & Publish Scheduler
 * Copyright (c) 2025 The loopcast contributors
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>

#include "loopcast/types.hpp"

namespace loopcast {

class HttpClient;

struct Session {
    std::string accessToken;
    TimePoint expiresAt{};
};

struct SessionResult {
    bool ok = false;
    Session session;
    std::string message;    // set when no session could be established
    explicit operator bool() const noexcept { return ok; }
};

// Supplies an authenticated session for the hosting platform.
class SessionProvider {
public:
    virtual ~SessionProvider() = default;
    [[nodiscard]] virtual SessionResult acquire() noexcept = 0;
};

/*
 * Authorized-user token file as written by the platform's installed-app
 * authorization flow:
 *   {"token": ..., "refresh_token": ..., "token_uri": ..., "client_id": ...,
 *    "client_secret": ..., "expiry": "2025-01-01T00:00:00Z"}
 * Client id/secret/token_uri missing from the token file are taken from the
 * client secrets file. Expired tokens are refreshed and written back.
 * Running the interactive authorization flow is not part of this provider.
 */
class TokenFileSessionProvider final : public SessionProvider {
public:
    TokenFileSessionProvider(const HttpClient& http,
                             std::filesystem::path tokenFile,
                             std::filesystem::path secretsFile);

    [[nodiscard]] SessionResult acquire() noexcept override;

private:
    const HttpClient& http_;
    std::filesystem::path tokenFile_;
    std::filesystem::path secretsFile_;

    std::mutex mutex_;
    std::optional<Session> cached_;
};

// RFC 3339 UTC ("2025-01-01T00:00:00Z", fractional seconds ignored).
[[nodiscard]] std::optional<TimePoint> parseUtcTimestamp(const std::string& text);
[[nodiscard]] std::string formatUtcTimestamp(TimePoint tp);

}
