#include "TrafficLogger.hpp"

#include <algorithm>
#include <chrono>
#include <sstream>
#include <string_view>
#include <fmt/format.h>

#include "../debug/log.hpp"

CTrafficLogger::CTrafficLogger(const std::string& schema, const std::string& file) {
    const auto COMMAS = std::count(schema.begin(), schema.end(), ',');

    // parse the schema
    std::string_view curr;
    size_t           lastPos = 0;
    bool             first   = true;
    auto             advance = [&]() {
        size_t prev = !first ? lastPos + 1 : lastPos;
        lastPos     = schema.find(',', prev);

        if (lastPos == std::string::npos)
            curr = std::string_view{schema}.substr(prev);
        else
            curr = std::string_view{schema}.substr(prev, lastPos - prev);

        first = false;
    };

    for (long i = 0; i < COMMAS + 1; ++i) {
        advance();

        if (curr == "ip")
            m_logSchema.emplace_back(TRAFFIC_IP);
        else if (curr == "epoch")
            m_logSchema.emplace_back(TRAFFIC_EPOCH);
        else if (curr == "origin")
            m_logSchema.emplace_back(TRAFFIC_ORIGIN);
        else if (curr == "method")
            m_logSchema.emplace_back(TRAFFIC_METHOD);
        else if (curr == "resource")
            m_logSchema.emplace_back(TRAFFIC_RESOURCE);
        else if (curr == "outcome")
            m_logSchema.emplace_back(TRAFFIC_OUTCOME);
        else if (curr == "status")
            m_logSchema.emplace_back(TRAFFIC_STATUS);
        else if (!curr.empty())
            Debug::log(WARN, "TrafficLogger: unknown schema field \"{}\", ignoring", curr);

        if (curr == "" || lastPos == std::string::npos)
            break;
    }

    if (file.empty())
        return;

    m_file.open(file, std::ios::app);

    if (!m_file.good())
        Debug::die("TrafficLogger: bad file {}", file);
}

CTrafficLogger::~CTrafficLogger() {
    if (m_file.is_open())
        m_file.close();
}

static std::string sanitize(const std::string& s) {
    if (s.empty())
        return s;

    std::string cpy = s;
    size_t      pos = 0;
    while ((pos = cpy.find('"', pos)) != std::string::npos) {
        cpy.replace(pos, 1, "\\\"");
        pos += 2;
    }

    std::replace(cpy.begin(), cpy.end(), '\n', ' ');

    return cpy;
}

std::string CTrafficLogger::formatLine(const SGatewayRequest& req, const SGatewayResponse& response) const {
    std::stringstream ss;

    for (const auto& t : m_logSchema) {
        switch (t) {
            case TRAFFIC_EPOCH: {
                ss << fmt::format("{},", std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count());
                break;
            }

            case TRAFFIC_IP: {
                ss << fmt::format("{},", req.ip);
                break;
            }

            case TRAFFIC_ORIGIN: {
                ss << fmt::format("\"{}\",", sanitize(req.origin.value_or("<no data>")));
                break;
            }

            case TRAFFIC_METHOD: {
                ss << fmt::format("{},", req.methodName);
                break;
            }

            case TRAFFIC_RESOURCE: {
                ss << fmt::format("\"{}\",", sanitize(req.resource));
                break;
            }

            case TRAFFIC_OUTCOME: {
                ss << fmt::format("{},", gatewayOutcomeToString(response.outcome));
                break;
            }

            case TRAFFIC_STATUS: {
                ss << fmt::format("{},", response.code);
                break;
            }
        }
    }

    std::string trafficLine = ss.str();
    if (trafficLine.empty())
        return trafficLine;

    // replace , with \n
    trafficLine.back() = '\n';

    return trafficLine;
}

void CTrafficLogger::logTraffic(const SGatewayRequest& req, const SGatewayResponse& response) {
    const auto LINE = formatLine(req, response);
    if (LINE.empty() || !m_file.is_open())
        return;

    std::lock_guard<std::mutex> lg(m_fileMutex);
    m_file << LINE;
    m_file.flush();
}
