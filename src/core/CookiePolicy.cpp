#include "CookiePolicy.hpp"

#include <cctype>

#include <algorithm>

#include <fmt/format.h>

SCookieAttributes NCookiePolicy::build(const std::string& credential, const SCookieConfig& config) {
    SCookieAttributes attributes;
    attributes.name     = config.name;
    attributes.value    = credential;
    attributes.path     = "/";
    attributes.maxAge   = config.maxAge;
    attributes.httpOnly = true;
    attributes.sameSite = config.sameSite;
    attributes.secure   = config.secure;

    // never derived from the request. A wider scope has to be asked for explicitly.
    if (config.domain.has_value() && !config.domain->empty())
        attributes.domain = config.domain;

    return attributes;
}

std::string NCookiePolicy::serialize(const SCookieAttributes& attributes) {
    std::string cookie = fmt::format("{}={}; Path={}; Max-Age={}", attributes.name, attributes.value, attributes.path, attributes.maxAge);

    if (attributes.httpOnly)
        cookie += "; HttpOnly";

    cookie += fmt::format("; SameSite={}", sameSiteToString(attributes.sameSite));

    if (attributes.domain.has_value())
        cookie += fmt::format("; Domain={}", *attributes.domain);

    if (attributes.secure)
        cookie += "; Secure";

    return cookie;
}

const char* NCookiePolicy::sameSiteToString(eSameSite sameSite) {
    switch (sameSite) {
        case SAME_SITE_LAX: return "Lax";
        case SAME_SITE_STRICT: return "Strict";
        case SAME_SITE_NONE: return "None";
    }

    return "Lax";
}

std::optional<eSameSite> NCookiePolicy::sameSiteFromString(const std::string& str) {
    std::string LC = str;
    std::transform(LC.begin(), LC.end(), LC.begin(), [](unsigned char c) { return std::tolower(c); });

    if (LC == "lax")
        return SAME_SITE_LAX;
    if (LC == "strict")
        return SAME_SITE_STRICT;
    if (LC == "none")
        return SAME_SITE_NONE;

    return std::nullopt;
}
