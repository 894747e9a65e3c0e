#pragma once

#include <string>
#include <memory>
#include <vector>

#include <re2/re2.h>

#include "ConfigTypes.hpp"
#include "../core/CookiePolicy.hpp"

class CConfig {
  public:
    // configPath may be empty, defaults and environment are used then
    explicit CConfig(const std::string& configPath = "");

    struct SCookieSection {
        std::string       name      = "echo_session";
        std::string       domain    = "";
        bool              secure    = true;
        std::string       same_site = "Lax";
        unsigned long int max_age   = 60 * 60 * 24 * 30; // 30 days
    };

    struct SSessionStoreSection {
        std::string       backend     = "rpc";
        std::string       url         = "";
        std::string       api_key     = "";
        std::string       service_key = "";
        std::string       procedure   = "validate_session";
        unsigned long int timeout_sec = 10;
        std::string       sqlite_path = "";
    };

    struct SCorsSection {
        std::vector<std::string> allowed_origins = {};
        int                      max_age_sec     = 600;
    };

    struct SLoggingSection {
        bool        log_traffic        = false;
        std::string traffic_log_schema = "epoch,ip,method,outcome,status";
        std::string traffic_log_file   = "";
    };

    struct SConfig {
        int                  port             = 3001;
        int                  threads          = 2;
        unsigned long int    max_request_size = 65536; // 64kB, a token body is tiny
        bool                 trace_logging    = false;
        bool                 async_validation = true;
        SCookieSection       cookie;
        SSessionStoreSection session_store;
        SCorsSection         cors;
        SLoggingSection      logging;
    } m_config;

    struct {
        SCookieConfig                          cookie;
        eSessionStoreBackend                   backend = SESSION_STORE_RPC;
        std::vector<std::shared_ptr<re2::RE2>> allowedOrigins;
    } m_parsedConfigDatas;

  private:
    void applyEnvironment();
    void parseDatas();
};

inline std::unique_ptr<CConfig> g_pConfig;
