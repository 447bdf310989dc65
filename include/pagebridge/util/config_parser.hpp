#pragma once

#include "pagebridge/util/result.hpp"

#include <string>

namespace pagebridge::config {

constexpr const char* kDefaultGraphBaseUrl = "https://graph.microsoft.com";

class BridgeConfig {
public:
    std::string client_id;
    std::string tenant_id;
    std::string redirect_uri;
    std::string token_file = "tokens.json";
    std::string graph_base_url = kDefaultGraphBaseUrl;

    std::string log_level = "INFO";
    std::string log_file;
    std::string content_log_level = "DEBUG";

    int poll_max_attempts = 30;
    int poll_min_delay_seconds = 1;
    int poll_jitter_base_seconds = 2;
    int http_timeout_seconds = 60;

    // Shrink downloaded PNG items to 1024x768 before re-upload.
    bool scale_images = false;

    // Fills fields present in the JSON object at `path`; absent keys keep defaults.
    Result LoadFile(const std::string& path);

    // ONENOTE_CLIENT_ID, ONENOTE_TENANT_ID, ONENOTE_REDIRECT_URI, TOKEN_FILE,
    // LOG_LEVEL, LOG_FILE, CONTENT_LOG_LEVEL. Set variables win over the file.
    void ApplyEnvironment();

    Result Validate() const;

    void Reset();
};

// Defaults, then the file named by `path` (or $PAGEBRIDGE_CONFIG when empty),
// then the environment.
Result LoadBridgeConfig(const std::string& path, BridgeConfig& out);

} // namespace pagebridge::config
