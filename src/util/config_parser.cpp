#include "pagebridge/util/config_parser.hpp"

#include "pagebridge/util/config_json_utils.hpp"
#include "pagebridge/util/logger.hpp"

#include <cstdlib>

namespace pagebridge::config {

namespace {

bool OverrideFromEnv(const char* name, std::string& field) {
    const char* v = std::getenv(name);
    if (!v || *v == '\0')
        return false;
    field = v;
    return true;
}

bool StartsWith(const std::string& s, const char* prefix) {
    return s.rfind(prefix, 0) == 0;
}

} // namespace

void BridgeConfig::Reset() {
    *this = BridgeConfig{};
}

Result BridgeConfig::LoadFile(const std::string& path) {
    nlohmann::json json;
    std::string err;
    if (!detail::LoadJsonObjectFromFile(path, json, err)) {
        return Result::Invalid("Config: " + err);
    }

    if (!detail::FillConfigFromJson(json, *this, err)) {
        return Result::Invalid("Config: " + err + " in " + path);
    }

    return Result::Ok();
}

void BridgeConfig::ApplyEnvironment() {
    OverrideFromEnv("ONENOTE_CLIENT_ID", client_id);
    OverrideFromEnv("ONENOTE_TENANT_ID", tenant_id);
    OverrideFromEnv("ONENOTE_REDIRECT_URI", redirect_uri);
    OverrideFromEnv("TOKEN_FILE", token_file);
    OverrideFromEnv("LOG_LEVEL", log_level);
    OverrideFromEnv("LOG_FILE", log_file);
    OverrideFromEnv("CONTENT_LOG_LEVEL", content_log_level);
}

Result BridgeConfig::Validate() const {
    if (!StartsWith(graph_base_url, "https://") && !StartsWith(graph_base_url, "http://")) {
        return Result::Invalid("graph_base_url must start with http:// or https://: " + graph_base_url);
    }
    if (poll_max_attempts < 1) {
        return Result::Invalid("poll_max_attempts must be at least 1");
    }
    if (poll_min_delay_seconds < 0 || poll_jitter_base_seconds < 0) {
        return Result::Invalid("poll delays must not be negative");
    }
    if (http_timeout_seconds < 0) {
        return Result::Invalid("http_timeout_seconds must not be negative");
    }
    if (!ParseLogLevel(log_level)) {
        return Result::Invalid("unknown log_level: " + log_level);
    }
    if (!ParseLogLevel(content_log_level)) {
        return Result::Invalid("unknown content_log_level: " + content_log_level);
    }
    return Result::Ok();
}

Result LoadBridgeConfig(const std::string& path, BridgeConfig& out) {
    out.Reset();

    std::string effective = path;
    if (effective.empty()) {
        const char* env = std::getenv("PAGEBRIDGE_CONFIG");
        if (env) effective = env;
    }

    if (!effective.empty()) {
        auto r = out.LoadFile(effective);
        if (!r.is_ok())
            return r;
        LogDebug("Loaded config file %s", effective.c_str());
    }

    out.ApplyEnvironment();

    LogDebug("Config: client_id=%s tenant_id=%s token_file=%s base=%s",
             MaskSecret(out.client_id).c_str(),
             out.tenant_id.empty() ? "common" : out.tenant_id.c_str(),
             out.token_file.c_str(),
             out.graph_base_url.c_str());

    return out.Validate();
}

} // namespace pagebridge::config
