#include "pagebridge/net/token_refresher.hpp"

#include "pagebridge/util/logger.hpp"

#include <nlohmann/json.hpp>

namespace pagebridge {

std::string OAuthSettings::TokenEndpoint() const {
    const std::string tenant = tenant_id.empty() ? "common" : tenant_id;
    return authority + "/" + tenant + "/oauth2/v2.0/token";
}

OAuthTokenRefresher::OAuthTokenRefresher(IHttpTransport& http, OAuthSettings settings, const IClock& clock)
    : http_(http), settings_(std::move(settings)), clock_(clock) {}

Result OAuthTokenRefresher::Refresh(const std::string& refresh_token, TokenSet& out) {
    if (refresh_token.empty()) {
        return Result::Fail(ErrorKind::Auth, 0, "no refresh token available");
    }
    if (settings_.client_id.empty()) {
        return Result::Fail(ErrorKind::Auth, 0, "client_id is not configured");
    }

    HttpRequest req;
    req.method = "POST";
    req.url = settings_.TokenEndpoint();
    req.headers = {{"Content-Type", "application/x-www-form-urlencoded"}};
    req.body = "client_id=" + UrlEncode(settings_.client_id) +
               "&scope=" + UrlEncode(settings_.scope) +
               "&refresh_token=" + UrlEncode(refresh_token) +
               "&redirect_uri=" + UrlEncode(settings_.redirect_uri) +
               "&grant_type=refresh_token";

    LogInfo("Refreshing access token (client_id=%s)", MaskSecret(settings_.client_id).c_str());

    HttpResponse resp;
    auto r = http_.Send(req, resp);
    if (!r.is_ok()) {
        return Result::Fail(ErrorKind::Auth, 0, "token refresh request failed: " + r.msg);
    }
    if (resp.status != 200) {
        LogError("Token refresh failed: HTTP %d", resp.status);
        return Result::Fail(ErrorKind::Auth, resp.status, "token refresh failed: " + resp.body);
    }

    try {
        const auto j = nlohmann::json::parse(resp.body);
        TokenSet fresh;
        fresh.access_token = j.value("access_token", "");
        fresh.refresh_token = j.value("refresh_token", refresh_token);
        fresh.expiry = clock_.NowUnix() + j.value("expires_in", static_cast<std::int64_t>(0));
        if (fresh.access_token.empty()) {
            return Result::Fail(ErrorKind::Auth, resp.status, "token refresh response has no access_token");
        }
        out = std::move(fresh);
    } catch (const nlohmann::json::exception& e) {
        return Result::Fail(ErrorKind::Auth, resp.status,
                            std::string("invalid token refresh response: ") + e.what());
    }

    LogInfo("Token refresh successful");
    return Result::Ok();
}

} // namespace pagebridge
