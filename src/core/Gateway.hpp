#pragma once

#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "CookiePolicy.hpp"
#include "OriginPolicy.hpp"
#include "SessionValidator.hpp"
#include "../store/SessionStore.hpp"

enum eGatewayMethod : uint8_t {
    GATEWAY_METHOD_OTHER = 0,
    GATEWAY_METHOD_GET,
    GATEWAY_METHOD_POST,
    GATEWAY_METHOD_OPTIONS,
};

enum eGatewayOutcome : uint8_t {
    GATEWAY_OUTCOME_PREFLIGHT = 0,
    GATEWAY_OUTCOME_METHOD_NOT_ALLOWED,
    GATEWAY_OUTCOME_BAD_REQUEST,
    GATEWAY_OUTCOME_MISCONFIGURED,
    GATEWAY_OUTCOME_ISSUED,
    GATEWAY_OUTCOME_DENIED,
    GATEWAY_OUTCOME_STORE_UNAVAILABLE,
    GATEWAY_OUTCOME_INTERNAL_ERROR,
};

const char* gatewayOutcomeToString(eGatewayOutcome outcome);

struct SGatewayRequest {
    eGatewayMethod             method     = GATEWAY_METHOD_OTHER;
    std::string                methodName = "";
    std::string                resource   = "/";
    std::optional<std::string> origin;
    std::string                body = "";
    std::string                ip   = "";
};

struct SGatewayResponse {
    int                         code    = 500;
    eGatewayOutcome             outcome = GATEWAY_OUTCOME_INTERNAL_ERROR;
    std::string                 body    = "";
    bool                        json    = true;

    std::optional<std::string>  allowOrigin;
    bool                        allowCredentials = true;
    bool                        varyOrigin       = true;
    std::optional<std::string>  allowMethods;
    std::optional<std::string>  allowHeaders;
    std::optional<int>          maxAge;
    std::vector<eGatewayMethod> allow;
    std::optional<std::string>  setCookie;
};

/*
    Verify-and-issue: a POSTed bearer token is checked against the session store and,
    if it names a live session, handed back as an HttpOnly cookie.
    Holds no per-request state, handle() may be called from any number of threads.
*/
class CGateway {
  public:
    struct SGatewaySettings {
        SCookieConfig cookie;
        COriginPolicy origins;
        int           preflightMaxAge = 600;
    };

    // a null store means the deployment is missing its store configuration
    CGateway(SGatewaySettings settings, std::shared_ptr<ISessionStore> store);

    SGatewayResponse handle(const SGatewayRequest& req) const;

  private:
    SGatewayResponse                        handleInternal(const SGatewayRequest& req) const;
    SGatewayResponse                        preflight(const SGatewayRequest& req) const;
    SGatewayResponse                        respond(const SGatewayRequest& req, int code, eGatewayOutcome outcome) const;
    SGatewayResponse                        respondError(const SGatewayRequest& req, int code, eGatewayOutcome outcome, const std::string& message) const;

    std::expected<std::string, std::string> credentialFromBody(const std::string& body) const;

    SGatewaySettings                        m_settings;
    bool                                    m_configured = false;
    CSessionValidator                       m_validator;
};
