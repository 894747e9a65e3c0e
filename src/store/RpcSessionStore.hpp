#pragma once

#include <chrono>
#include <string>

#include "SessionStore.hpp"

// Calls a remote validate_session(p_token_hash) procedure exposed PostgREST-style
// at <url>/rest/v1/rpc/<procedure>, returning [{ "is_valid": bool }].
class CRpcSessionStore : public ISessionStore {
  public:
    struct SRpcSettings {
        std::string          url;
        std::string          apiKey;
        std::string          serviceKey;
        std::string          procedure = "validate_session";
        std::chrono::seconds timeout   = std::chrono::seconds(10);
    };

    CRpcSessionStore(const SRpcSettings& settings);

    std::expected<bool, std::string> isSessionValid(const std::string& tokenHash) override;
    const char*                      name() const override;

    std::string                      endpoint() const;

  private:
    struct SValidateSessionArgs {
        std::string p_token_hash;
    };

    struct SValidateSessionRow {
        bool is_valid = false;
    };

    SRpcSettings m_settings;
    std::string  m_endpoint;
};
