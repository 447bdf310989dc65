#pragma once

#include "pagebridge/net/http.hpp"
#include "pagebridge/net/token_store.hpp"
#include "pagebridge/util/clock.hpp"

#include <string>

namespace pagebridge {

class ITokenRefresher {
  public:
    virtual ~ITokenRefresher() = default;
    virtual Result Refresh(const std::string& refresh_token, TokenSet& out) = 0;
};

struct OAuthSettings {
    std::string client_id;
    std::string tenant_id; // empty means "common"
    std::string redirect_uri;
    std::string authority = "https://login.microsoftonline.com";
    std::string scope = "offline_access Notes.ReadWrite";

    std::string TokenEndpoint() const;
};

// refresh_token grant against the Microsoft identity platform.
class OAuthTokenRefresher final : public ITokenRefresher {
  public:
    OAuthTokenRefresher(IHttpTransport& http, OAuthSettings settings, const IClock& clock);

    Result Refresh(const std::string& refresh_token, TokenSet& out) override;

  private:
    IHttpTransport& http_;
    OAuthSettings settings_;
    const IClock& clock_;
};

} // namespace pagebridge
