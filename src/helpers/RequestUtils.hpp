#pragma once

#include <optional>
#include <string>

#include <pistache/http.h>

#include "../core/Gateway.hpp"

namespace NRequestUtils {
    std::string                           ipForRequest(const Pistache::Http::Request& req);
    std::optional<std::string>            originForRequest(const Pistache::Http::Request& req);
    eGatewayMethod                        gatewayMethod(Pistache::Http::Method method);
    std::optional<Pistache::Http::Method> pistacheMethod(eGatewayMethod method);
    SGatewayRequest                       toGatewayRequest(const Pistache::Http::Request& req);
};
