#include "pagebridge/net/token_store.hpp"

#include "pagebridge/util/logger.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sys/stat.h>
#include <unistd.h>

namespace pagebridge {

Result TokenSet::LoadFromFile(const std::string& path, TokenSet& out) {
    out = TokenSet{};

    std::ifstream is(path);
    if (!is.good()) {
        return Result::Fail(ErrorKind::Auth, 0, "cannot open token file: " + path);
    }

    nlohmann::json j;
    try {
        is >> j;
    } catch (const std::exception& e) {
        return Result::Fail(ErrorKind::Auth, 0, std::string("invalid JSON in ") + path + ": " + e.what());
    }

    if (!j.is_object()) {
        return Result::Fail(ErrorKind::Auth, 0, "token file must be JSON object: " + path);
    }

    try {
        out.access_token = j.value("access_token", "");
        out.refresh_token = j.value("refresh_token", "");
        out.expiry = j.value("expiry", static_cast<std::int64_t>(0));
    } catch (const nlohmann::json::exception& e) {
        return Result::Fail(ErrorKind::Auth, 0, std::string("malformed token file ") + path + ": " + e.what());
    }

    LogDebug("Loaded tokens from %s: access=%s refresh=%s expiry=%lld",
             path.c_str(),
             MaskSecret(out.access_token).c_str(),
             MaskSecret(out.refresh_token).c_str(),
             static_cast<long long>(out.expiry));
    return Result::Ok();
}

Result TokenSet::SaveToFile(const std::string& path) const {
    const nlohmann::json j = {
        {"access_token", access_token},
        {"refresh_token", refresh_token},
        {"expiry", expiry},
    };

    const std::string tmp = path + ".tmp";
    {
        std::ofstream os(tmp, std::ios::trunc);
        if (!os.good()) {
            return Result::Fail(ErrorKind::Auth, errno, "cannot write token file: " + tmp);
        }
        os << j.dump() << "\n";
        if (!os.good()) {
            return Result::Fail(ErrorKind::Auth, errno, "write failed: " + tmp);
        }
    }
    (void)::chmod(tmp.c_str(), 0600);

    if (::rename(tmp.c_str(), path.c_str()) != 0) {
        const int e = errno;
        (void)::unlink(tmp.c_str());
        return Result::Fail(ErrorKind::Auth, e,
                            "rename " + tmp + " -> " + path + " failed: " + std::strerror(e));
    }
    return Result::Ok();
}

} // namespace pagebridge
