#pragma once

#include "pagebridge/util/result.hpp"

#include <cstdint>
#include <string>

namespace pagebridge {

struct TokenSet {
    std::string access_token;
    std::string refresh_token;
    std::int64_t expiry = 0; // unix seconds

    // Tokens are treated as expired a minute early.
    static constexpr std::int64_t kExpiryBufferSeconds = 60;

    bool IsExpired(std::int64_t now_unix) const { return now_unix > expiry - kExpiryBufferSeconds; }
    bool Empty() const { return access_token.empty() && refresh_token.empty(); }

    static Result LoadFromFile(const std::string& path, TokenSet& out);
    Result SaveToFile(const std::string& path) const;
};

} // namespace pagebridge
