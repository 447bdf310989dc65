#pragma once

#include "pagebridge/net/http.hpp"

namespace pagebridge {

// libcurl-backed transport. One easy handle per request, so a single instance
// can be shared between threads.
class CurlHttpTransport final : public IHttpTransport {
  public:
    explicit CurlHttpTransport(long timeout_seconds = 60);

    Result Send(const HttpRequest& req, HttpResponse& out) override;

  private:
    long timeout_seconds_ = 60;
};

} // namespace pagebridge
