#include "pagebridge/net/curl_transport.hpp"

#include "pagebridge/util/logger.hpp"

#include <curl/curl.h>

#include <mutex>

namespace pagebridge {

namespace {

void EnsureCurlGlobalInit() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

class CurlHandle final {
  public:
    CurlHandle() : h_(curl_easy_init()) {}
    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
    ~CurlHandle() {
        if (h_) curl_easy_cleanup(h_);
    }

    CURL* get() const { return h_; }
    bool ok() const { return h_ != nullptr; }

  private:
    CURL* h_ = nullptr;
};

class HeaderList final {
  public:
    HeaderList() = default;
    HeaderList(const HeaderList&) = delete;
    HeaderList& operator=(const HeaderList&) = delete;
    ~HeaderList() {
        if (list_) curl_slist_free_all(list_);
    }

    bool Append(const std::string& line) {
        curl_slist* next = curl_slist_append(list_, line.c_str());
        if (!next) return false;
        list_ = next;
        return true;
    }

    curl_slist* get() const { return list_; }

  private:
    curl_slist* list_ = nullptr;
};

size_t WriteBody(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

size_t WriteHeader(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* headers = static_cast<HttpHeaders*>(userdata);
    const size_t n = size * nmemb;
    std::string line(ptr, n);
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) line.pop_back();

    // A new status line starts a fresh header block (redirects, 100-continue).
    if (line.rfind("HTTP/", 0) == 0) {
        headers->clear();
        return n;
    }
    const auto colon = line.find(':');
    if (colon == std::string::npos) return n;

    std::string value = line.substr(colon + 1);
    const auto first = value.find_first_not_of(" \t");
    value = (first == std::string::npos) ? std::string() : value.substr(first);
    headers->emplace_back(line.substr(0, colon), std::move(value));
    return n;
}

} // namespace

CurlHttpTransport::CurlHttpTransport(long timeout_seconds) : timeout_seconds_(timeout_seconds) {
    EnsureCurlGlobalInit();
}

Result CurlHttpTransport::Send(const HttpRequest& req, HttpResponse& out) {
    out = HttpResponse{};

    CurlHandle curl;
    if (!curl.ok()) {
        return Result::Fail(ErrorKind::Transport, 0, "curl init failed");
    }

    HeaderList headers;
    for (const auto& [k, v] : req.headers) {
        if (!headers.Append(k + ": " + v)) {
            return Result::Fail(ErrorKind::Transport, 0, "curl header list allocation failed");
        }
    }
    // Multipart bodies can be large; do not wait for 100-continue.
    (void)headers.Append("Expect:");

    CURL* h = curl.get();
    curl_easy_setopt(h, CURLOPT_URL, req.url.c_str());
    curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(h, CURLOPT_TIMEOUT, timeout_seconds_);
    curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(h, CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, &WriteBody);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &out.body);
    curl_easy_setopt(h, CURLOPT_HEADERFUNCTION, &WriteHeader);
    curl_easy_setopt(h, CURLOPT_HEADERDATA, &out.headers);

    if (req.method == "GET") {
        curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
    } else {
        curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, req.method.c_str());
        if (!req.body.empty() || req.method != "DELETE") {
            curl_easy_setopt(h, CURLOPT_POSTFIELDS, req.body.data());
            curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(req.body.size()));
        }
    }

    LogDebug("HTTP %s %s (%zu bytes)", req.method.c_str(), req.url.c_str(), req.body.size());

    const CURLcode rc = curl_easy_perform(h);
    if (rc != CURLE_OK) {
        LogDebug("HTTP %s %s failed: %s", req.method.c_str(), req.url.c_str(), curl_easy_strerror(rc));
        return Result::Fail(ErrorKind::Transport, 0,
                            std::string("curl error: ") + curl_easy_strerror(rc));
    }

    long status = 0;
    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &status);
    out.status = static_cast<int>(status);

    LogDebug("HTTP %s %s -> %d (%zu bytes)",
             req.method.c_str(), req.url.c_str(), out.status, out.body.size());
    return Result::Ok();
}

} // namespace pagebridge
