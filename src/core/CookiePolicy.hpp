#pragma once

#include <string>
#include <optional>
#include <cstdint>

#include "../config/ConfigTypes.hpp"

constexpr const char*    SESSION_COOKIE_NAME    = "echo_session";
constexpr const uint64_t SESSION_COOKIE_MAX_AGE = 60 * 60 * 24 * 30; // 30 days

// Deployment-wide cookie settings, fixed at startup.
struct SCookieConfig {
    std::string                name     = SESSION_COOKIE_NAME;
    std::optional<std::string> domain   = std::nullopt;
    bool                       secure   = true;
    eSameSite                  sameSite = SAME_SITE_LAX;
    uint64_t                   maxAge   = SESSION_COOKIE_MAX_AGE;
};

struct SCookieAttributes {
    std::string                name;
    std::string                value;
    std::string                path     = "/";
    uint64_t                   maxAge   = SESSION_COOKIE_MAX_AGE;
    bool                       httpOnly = true;
    eSameSite                  sameSite = SAME_SITE_LAX;
    bool                       secure   = true;
    std::optional<std::string> domain;
};

namespace NCookiePolicy {
    SCookieAttributes build(const std::string& credential, const SCookieConfig& config);

    // name=value; Path=/; Max-Age=n; HttpOnly; SameSite=x[; Domain=d][; Secure]
    std::string serialize(const SCookieAttributes& attributes);

    const char*              sameSiteToString(eSameSite sameSite);
    std::optional<eSameSite> sameSiteFromString(const std::string& str);
};
