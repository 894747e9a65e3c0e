#include "Config.hpp"

#include <algorithm>
#include <cctype>
#include <limits>
#include <cstdlib>
#include <filesystem>
#include <optional>

#include <glaze/glaze.hpp>

#include "../helpers/FsUtils.hpp"

#include "../debug/log.hpp"

static std::optional<std::string> envValue(const char* name) {
    const char* value = std::getenv(name);
    if (!value)
        return std::nullopt;
    return std::string{value};
}

static std::optional<std::string> envValue(const char* name, const char* fallbackName) {
    if (auto value = envValue(name); value.has_value())
        return value;
    return envValue(fallbackName);
}

static std::optional<bool> strToBool(const std::string& s) {
    std::string LC = s;
    std::transform(LC.begin(), LC.end(), LC.begin(), [](unsigned char c) { return std::tolower(c); });

    if (LC == "true" || LC == "1" || LC == "yes" || LC == "on")
        return true;
    if (LC == "false" || LC == "0" || LC == "no" || LC == "off")
        return false;

    return std::nullopt;
}

static unsigned long int strToUnsigned(const char* name, const std::string& s) {
    // stoul accepts a sign and wraps "-1" around
    if (!s.empty() && std::isdigit(static_cast<unsigned char>(s.front()))) {
        try {
            size_t     pos = 0;
            const auto N   = std::stoul(s, &pos);
            if (pos == s.size())
                return N;
        } catch (std::exception& e) { ; }
    }

    Debug::die("Environment variable {} is not a non-negative number: \"{}\"", name, s);
}

static std::optional<eSessionStoreBackend> strToBackend(const std::string& s) {
    std::string LC = s;
    std::transform(LC.begin(), LC.end(), LC.begin(), [](unsigned char c) { return std::tolower(c); });

    if (LC == "rpc")
        return SESSION_STORE_RPC;
    if (LC == "sqlite")
        return SESSION_STORE_SQLITE;

    return std::nullopt;
}

CConfig::CConfig(const std::string& configPath) {
    if (!configPath.empty()) {
        const auto PATH     = NFsUtils::isAbsolute(configPath) ? configPath : std::filesystem::current_path().string() + "/" + configPath;
        const auto CONTENTS = NFsUtils::readFileAsString(PATH);

        if (!CONTENTS.has_value())
            Debug::die("Config file {} could not be read: {}", PATH, CONTENTS.error());

        auto json = glz::read_jsonc<SConfig>(CONTENTS.value());

        if (!json.has_value())
            Debug::die("Config file {} has bad format", PATH);

        m_config = json.value();
    }

    applyEnvironment();
    parseDatas();
}

void CConfig::applyEnvironment() {
    if (auto v = envValue("PORT")) {
        const auto PORT = strToUnsigned("PORT", *v);
        if (PORT > 65535)
            Debug::die("PORT {} is out of range", PORT);
        m_config.port = (int)PORT;
    }

    if (auto v = envValue("COOKIE_NAME"))
        m_config.cookie.name = *v;

    if (auto v = envValue("COOKIE_DOMAIN"))
        m_config.cookie.domain = *v;

    if (auto v = envValue("COOKIE_SECURE")) {
        const auto SECURE = strToBool(*v);
        if (!SECURE.has_value())
            Debug::die("COOKIE_SECURE must be a boolean, got \"{}\"", *v);
        m_config.cookie.secure = *SECURE;
    }

    if (auto v = envValue("COOKIE_SAME_SITE"))
        m_config.cookie.same_site = *v;

    if (auto v = envValue("COOKIE_MAX_AGE"))
        m_config.cookie.max_age = strToUnsigned("COOKIE_MAX_AGE", *v);

    if (auto v = envValue("SESSION_STORE_URL", "SUPABASE_URL"))
        m_config.session_store.url = *v;

    if (auto v = envValue("SESSION_STORE_API_KEY", "SUPABASE_PUBLISHABLE_KEY"))
        m_config.session_store.api_key = *v;

    if (auto v = envValue("SESSION_STORE_SERVICE_KEY", "SUPABASE_SERVICE_ROLE_KEY"))
        m_config.session_store.service_key = *v;

    if (auto v = envValue("SESSION_STORE_SQLITE_PATH"))
        m_config.session_store.sqlite_path = *v;
}

void CConfig::parseDatas() {
    auto& cookie = m_parsedConfigDatas.cookie;

    if (m_config.cookie.name.empty() || m_config.cookie.name.find_first_of("=; \t\r\n") != std::string::npos)
        Debug::die("Invalid cookie name \"{}\"", m_config.cookie.name);

    cookie.name   = m_config.cookie.name;
    cookie.secure = m_config.cookie.secure;
    cookie.maxAge = m_config.cookie.max_age;
    cookie.domain = m_config.cookie.domain.empty() ? std::nullopt : std::optional<std::string>{m_config.cookie.domain};

    const auto SAME_SITE = NCookiePolicy::sameSiteFromString(m_config.cookie.same_site);
    if (!SAME_SITE.has_value())
        Debug::die("Invalid same_site \"{}\", expected Lax, Strict or None", m_config.cookie.same_site);
    cookie.sameSite = *SAME_SITE;

    if (cookie.sameSite == SAME_SITE_NONE && !cookie.secure)
        Debug::die("Cookie same_site None requires secure, browsers drop it otherwise");

    if (!cookie.secure)
        Debug::log(WARN, "Session cookies are issued without the Secure flag");

    if (m_config.port < 1 || m_config.port > 65535)
        Debug::die("Invalid port {}, expected 1-65535", m_config.port);

    if (m_config.cookie.max_age > (unsigned long int)std::numeric_limits<int>::max())
        Debug::die("Invalid cookie max_age {}", m_config.cookie.max_age);

    const auto BACKEND = strToBackend(m_config.session_store.backend);
    if (!BACKEND.has_value())
        Debug::die("Invalid session_store.backend \"{}\", expected rpc or sqlite", m_config.session_store.backend);
    m_parsedConfigDatas.backend = *BACKEND;

    for (const auto& origin : m_config.cors.allowed_origins) {
        auto re = std::make_shared<re2::RE2>(origin);
        if (re->error_code() != RE2::NoError) {
            Debug::log(CRIT, "Regex \"{}\" failed to parse", origin);
            Debug::die("Failed to parse regex");
        }

        m_parsedConfigDatas.allowedOrigins.emplace_back(std::move(re));
    }
}
