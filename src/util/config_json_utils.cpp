#include "pagebridge/util/config_json_utils.hpp"

#include <cstdint>
#include <fstream>
#include <limits>

namespace pagebridge::config::detail {

namespace {

// Returns false when the key is absent; `err` is set when present but mistyped.
bool GetStringIfPresent(const nlohmann::json& j, const char* key, std::string& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return false;
    if (!it->is_string()) {
        err = std::string(key) + " must be a string";
        return false;
    }
    out = it->get<std::string>();
    return true;
}

bool GetIntIfPresent(const nlohmann::json& j, const char* key, int& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return false;
    if (!(it->is_number_unsigned() || it->is_number_integer())) {
        err = std::string(key) + " must be an integer";
        return false;
    }
    bool in_range = false;
    if (it->is_number_unsigned()) {
        in_range = it->get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<int>::max());
    } else {
        const auto v = it->get<std::int64_t>();
        in_range = v >= std::numeric_limits<int>::min() && v <= std::numeric_limits<int>::max();
    }
    if (!in_range) {
        err = std::string(key) + " is out of range";
        return false;
    }
    out = static_cast<int>(it->get<std::int64_t>());
    return true;
}

bool GetBoolIfPresent(const nlohmann::json& j, const char* key, bool& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return false;
    if (!it->is_boolean()) {
        err = std::string(key) + " must be a boolean";
        return false;
    }
    out = it->get<bool>();
    return true;
}

} // namespace

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err) {
    std::ifstream is(path);
    if (!is.good()) {
        err = "cannot open " + path;
        return false;
    }

    try {
        is >> out;
    } catch (const std::exception& e) {
        err = "invalid JSON in " + path + ": " + e.what();
        return false;
    }

    if (!out.is_object()) {
        err = "root must be JSON object: " + path;
        return false;
    }

    return true;
}

bool FillConfigFromJson(const nlohmann::json& j, BridgeConfig& cfg, std::string& err) {
    err.clear();

    GetStringIfPresent(j, "client_id", cfg.client_id, err);
    GetStringIfPresent(j, "tenant_id", cfg.tenant_id, err);
    GetStringIfPresent(j, "redirect_uri", cfg.redirect_uri, err);
    GetStringIfPresent(j, "token_file", cfg.token_file, err);
    GetStringIfPresent(j, "graph_base_url", cfg.graph_base_url, err);
    GetStringIfPresent(j, "log_level", cfg.log_level, err);
    GetStringIfPresent(j, "log_file", cfg.log_file, err);
    GetStringIfPresent(j, "content_log_level", cfg.content_log_level, err);
    if (!err.empty())
        return false;

    GetIntIfPresent(j, "poll_max_attempts", cfg.poll_max_attempts, err);
    GetIntIfPresent(j, "poll_min_delay_seconds", cfg.poll_min_delay_seconds, err);
    GetIntIfPresent(j, "poll_jitter_base_seconds", cfg.poll_jitter_base_seconds, err);
    GetIntIfPresent(j, "http_timeout_seconds", cfg.http_timeout_seconds, err);
    if (!err.empty())
        return false;

    GetBoolIfPresent(j, "scale_images", cfg.scale_images, err);
    if (!err.empty())
        return false;

    while (!cfg.graph_base_url.empty() && cfg.graph_base_url.back() == '/') {
        cfg.graph_base_url.pop_back();
    }

    return true;
}

} // namespace pagebridge::config::detail
