#pragma once

#include "pagebridge/net/http.hpp"
#include "pagebridge/net/token_refresher.hpp"
#include "pagebridge/net/token_store.hpp"
#include "pagebridge/util/clock.hpp"

#include <mutex>
#include <string>

namespace pagebridge {

// Decorates a transport with a bearer token. Refreshes expired tokens before
// sending and retries once after a refresh when the service answers 401/403.
// Safe to share between threads; refreshes are serialized.
class AuthenticatedTransport final : public IHttpTransport {
  public:
    // `refresher` may be null, in which case expired tokens are sent as-is
    // and auth failures are returned without retry. `token_path` empty
    // disables persisting refreshed tokens.
    AuthenticatedTransport(IHttpTransport& inner,
                           ITokenRefresher* refresher,
                           TokenSet tokens,
                           std::string token_path,
                           const IClock& clock);

    Result Send(const HttpRequest& req, HttpResponse& out) override;

    TokenSet Tokens() const;

  private:
    // Refreshes unless the access token differs from `stale_access`, which
    // means another caller already refreshed while we waited for the lock.
    Result RefreshLocked(const std::string& stale_access);
    Result SendWithToken(const HttpRequest& req, const std::string& access, HttpResponse& out);

    IHttpTransport& inner_;
    ITokenRefresher* refresher_ = nullptr;
    std::string token_path_;
    const IClock& clock_;

    mutable std::mutex mu_;
    TokenSet tokens_;
};

} // namespace pagebridge
