#include "pagebridge/net/authenticated_transport.hpp"

#include "pagebridge/util/logger.hpp"

namespace pagebridge {

namespace {

bool IsAuthFailure(int status) {
    return status == 401 || status == 403;
}

} // namespace

AuthenticatedTransport::AuthenticatedTransport(IHttpTransport& inner,
                                               ITokenRefresher* refresher,
                                               TokenSet tokens,
                                               std::string token_path,
                                               const IClock& clock)
    : inner_(inner),
      refresher_(refresher),
      token_path_(std::move(token_path)),
      clock_(clock),
      tokens_(std::move(tokens)) {}

TokenSet AuthenticatedTransport::Tokens() const {
    std::lock_guard<std::mutex> lk(mu_);
    return tokens_;
}

Result AuthenticatedTransport::RefreshLocked(const std::string& stale_access) {
    if (tokens_.access_token != stale_access && !tokens_.IsExpired(clock_.NowUnix())) {
        LogDebug("Token already refreshed by another request");
        return Result::Ok();
    }
    if (!refresher_) {
        return Result::Fail(ErrorKind::Auth, 0, "no token refresher configured");
    }

    TokenSet fresh;
    auto r = refresher_->Refresh(tokens_.refresh_token, fresh);
    if (!r.is_ok()) return r;

    tokens_ = std::move(fresh);
    if (!token_path_.empty()) {
        auto s = tokens_.SaveToFile(token_path_);
        if (!s.is_ok()) {
            LogWarn("Failed to save refreshed tokens: %s", s.msg.c_str());
        }
    }
    return Result::Ok();
}

Result AuthenticatedTransport::SendWithToken(const HttpRequest& req,
                                             const std::string& access,
                                             HttpResponse& out) {
    HttpRequest authed = req;
    SetHeader(authed.headers, "Authorization", "Bearer " + access);
    out = HttpResponse{};
    return inner_.Send(authed, out);
}

Result AuthenticatedTransport::Send(const HttpRequest& req, HttpResponse& out) {
    std::string access;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (tokens_.Empty()) {
            return Result::Fail(ErrorKind::Auth, 0,
                                "authentication required: tokens have been cleared, re-authenticate");
        }
        if (refresher_ && tokens_.IsExpired(clock_.NowUnix())) {
            LogInfo("Access token expired, refreshing before %s", req.method.c_str());
            auto r = RefreshLocked(tokens_.access_token);
            if (!r.is_ok()) {
                return Result::Fail(ErrorKind::Auth, r.err, "token expired and refresh failed: " + r.msg);
            }
        }
        access = tokens_.access_token;
    }

    LogDebug("%s %s", req.method.c_str(), req.url.c_str());
    auto r = SendWithToken(req, access, out);
    if (!r.is_ok()) return r;

    if (!IsAuthFailure(out.status) || !refresher_) {
        return Result::Ok();
    }

    LogWarn("HTTP %d for %s %s, refreshing token and retrying", out.status, req.method.c_str(),
            req.url.c_str());
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto rr = RefreshLocked(access);
        if (!rr.is_ok()) {
            return Result::Fail(ErrorKind::Auth, out.status,
                                "authentication failed and token refresh failed: " + rr.msg);
        }
        access = tokens_.access_token;
    }

    r = SendWithToken(req, access, out);
    if (!r.is_ok()) return r;
    if (IsAuthFailure(out.status)) {
        return Result::Fail(ErrorKind::Auth, out.status,
                            "authentication failed even after token refresh: HTTP " +
                                std::to_string(out.status) + " - " + out.body);
    }
    return Result::Ok();
}

} // namespace pagebridge
