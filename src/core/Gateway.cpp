#include "Gateway.hpp"

#include "../debug/log.hpp"

#include <glaze/glaze.hpp>

constexpr const char* ALLOWED_METHODS = "POST, OPTIONS";
const std::vector<eGatewayMethod> ALLOWED_METHOD_LIST = {GATEWAY_METHOD_POST, GATEWAY_METHOD_OPTIONS};
constexpr const char* ALLOWED_HEADERS = "Content-Type, Authorization";

constexpr const char* MSG_BAD_BODY        = "Invalid request body";
constexpr const char* MSG_TOKEN_REQUIRED  = "Token required";
constexpr const char* MSG_INVALID_SESSION = "Invalid session token";
constexpr const char* MSG_METHOD          = "Method not allowed";
constexpr const char* MSG_CONFIGURATION   = "Server configuration error";
constexpr const char* MSG_INTERNAL        = "Internal server error";

namespace {
    struct SCredentialBody {
        std::optional<std::string> token;
    };

    struct SErrorBody {
        std::string error;
    };

    struct SSuccessBody {
        bool success = true;
    };
}

const char* gatewayOutcomeToString(eGatewayOutcome outcome) {
    switch (outcome) {
        case GATEWAY_OUTCOME_PREFLIGHT: return "PREFLIGHT";
        case GATEWAY_OUTCOME_METHOD_NOT_ALLOWED: return "METHOD_NOT_ALLOWED";
        case GATEWAY_OUTCOME_BAD_REQUEST: return "BAD_REQUEST";
        case GATEWAY_OUTCOME_MISCONFIGURED: return "MISCONFIGURED";
        case GATEWAY_OUTCOME_ISSUED: return "ISSUED";
        case GATEWAY_OUTCOME_DENIED: return "DENIED";
        case GATEWAY_OUTCOME_STORE_UNAVAILABLE: return "STORE_UNAVAILABLE";
        case GATEWAY_OUTCOME_INTERNAL_ERROR: return "INTERNAL_ERROR";
    }

    return "ERROR";
}

CGateway::CGateway(SGatewaySettings settings, std::shared_ptr<ISessionStore> store) :
    m_settings(std::move(settings)), m_configured(store != nullptr), m_validator(std::move(store)) {
    ;
}

SGatewayResponse CGateway::handle(const SGatewayRequest& req) const {
    try {
        return handleInternal(req);
    } catch (std::exception& e) { Debug::log(ERR, "Gateway: unhandled exception: {}", e.what()); } catch (...) {
        Debug::log(ERR, "Gateway: unhandled exception of unknown type");
    }

    return respondError(req, 500, GATEWAY_OUTCOME_INTERNAL_ERROR, MSG_INTERNAL);
}

SGatewayResponse CGateway::handleInternal(const SGatewayRequest& req) const {
    if (req.method == GATEWAY_METHOD_OPTIONS) {
        Debug::log(LOG, " | Action: PREFLIGHT");
        return preflight(req);
    }

    if (req.method != GATEWAY_METHOD_POST) {
        Debug::log(LOG, " | Action: REJECT (method {})", req.methodName);
        auto response  = respondError(req, 405, GATEWAY_OUTCOME_METHOD_NOT_ALLOWED, MSG_METHOD);
        response.allow = ALLOWED_METHOD_LIST;
        return response;
    }

    const auto CREDENTIAL = credentialFromBody(req.body);
    if (!CREDENTIAL.has_value()) {
        Debug::log(LOG, " | Action: REJECT (bad body: {})", CREDENTIAL.error());
        return respondError(req, 400, GATEWAY_OUTCOME_BAD_REQUEST, CREDENTIAL.error());
    }

    if (!m_configured) {
        Debug::log(ERR, "Gateway: no session store configured, cannot validate tokens");
        return respondError(req, 500, GATEWAY_OUTCOME_MISCONFIGURED, MSG_CONFIGURATION);
    }

    const auto OUTCOME = m_validator.validate(CREDENTIAL.value());

    switch (OUTCOME) {
        case VALIDATION_VALID: {
            Debug::log(LOG, " | Action: ISSUE (session valid)");

            const auto COOKIE = NCookiePolicy::build(CREDENTIAL.value(), m_settings.cookie);

            auto       response = respond(req, 200, GATEWAY_OUTCOME_ISSUED);
            response.setCookie  = NCookiePolicy::serialize(COOKIE);
            response.body       = glz::write_json(SSuccessBody{}).value_or(R"({"success":true})");
            return response;
        }
        case VALIDATION_INVALID: {
            Debug::log(LOG, " | Action: DENY (session invalid)");
            return respondError(req, 401, GATEWAY_OUTCOME_DENIED, MSG_INVALID_SESSION);
        }
        case VALIDATION_STORE_UNAVAILABLE: {
            Debug::log(ERR, " | Action: DENY (session store unavailable)");
            return respondError(req, 503, GATEWAY_OUTCOME_STORE_UNAVAILABLE, MSG_INTERNAL);
        }
    }

    return respondError(req, 500, GATEWAY_OUTCOME_INTERNAL_ERROR, MSG_INTERNAL);
}

SGatewayResponse CGateway::preflight(const SGatewayRequest& req) const {
    auto response         = respond(req, 204, GATEWAY_OUTCOME_PREFLIGHT);
    response.json         = false;
    response.allowMethods = ALLOWED_METHODS;
    response.allowHeaders = ALLOWED_HEADERS;
    response.maxAge       = m_settings.preflightMaxAge;
    return response;
}

SGatewayResponse CGateway::respond(const SGatewayRequest& req, int code, eGatewayOutcome outcome) const {
    SGatewayResponse response;
    response.code             = code;
    response.outcome          = outcome;
    response.allowOrigin      = m_settings.origins.allowedOrigin(req.origin);
    response.allowCredentials = true;
    response.varyOrigin       = true;
    return response;
}

SGatewayResponse CGateway::respondError(const SGatewayRequest& req, int code, eGatewayOutcome outcome, const std::string& message) const {
    auto response = respond(req, code, outcome);
    response.body = glz::write_json(SErrorBody{.error = message}).value_or(R"({"error":"Internal server error"})");
    return response;
}

std::expected<std::string, std::string> CGateway::credentialFromBody(const std::string& body) const {
    SCredentialBody parsed;

    if (!body.empty()) {
        const auto ERR = glz::read<glz::opts{.error_on_unknown_keys = false, .validate_trailing_whitespace = true}>(parsed, body);
        if (ERR)
            return std::unexpected(MSG_BAD_BODY);
    }

    if (!parsed.token.has_value() || parsed.token->empty())
        return std::unexpected(MSG_TOKEN_REQUIRED);

    return parsed.token.value();
}
