#pragma once

#include <string>
#include <cstdint>
#include <memory>
#include <mutex>
#include <fstream>
#include <vector>

#include "../core/Gateway.hpp"

// Appends one line per gateway decision. Never records the credential.
class CTrafficLogger {
  public:
    CTrafficLogger(const std::string& schema, const std::string& file);
    ~CTrafficLogger();

    void        logTraffic(const SGatewayRequest& req, const SGatewayResponse& response);

    std::string formatLine(const SGatewayRequest& req, const SGatewayResponse& response) const;

  private:
    enum eTrafficLoggerProps : uint8_t {
        TRAFFIC_EPOCH = 0,
        TRAFFIC_IP,
        TRAFFIC_ORIGIN,
        TRAFFIC_METHOD,
        TRAFFIC_RESOURCE,
        TRAFFIC_OUTCOME,
        TRAFFIC_STATUS,
    };

    std::vector<eTrafficLoggerProps> m_logSchema;
    std::ofstream                    m_file;
    std::mutex                       m_fileMutex;
};

inline std::unique_ptr<CTrafficLogger> g_pTrafficLogger;
