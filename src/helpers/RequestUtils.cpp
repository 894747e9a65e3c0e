#include "RequestUtils.hpp"

#include "../headers/forwardedIpHeaders.hpp"
#include "../headers/originHeader.hpp"

std::string NRequestUtils::ipForRequest(const Pistache::Http::Request& req) {
    std::shared_ptr<const CFConnectingIPHeader> cfHeader;
    std::shared_ptr<const XRealIPHeader>        xRealIPHeader;

    try {
        cfHeader = Pistache::Http::Header::header_cast<CFConnectingIPHeader>(req.headers().get("cf-connecting-ip"));
    } catch (std::exception& e) {
        ; // silent ignore
    }

    try {
        xRealIPHeader = Pistache::Http::Header::header_cast<XRealIPHeader>(req.headers().get("X-Real-IP"));
    } catch (std::exception& e) {
        ; // silent ignore
    }

    if (cfHeader)
        return cfHeader->ip();

    if (xRealIPHeader)
        return xRealIPHeader->ip();

    return req.address().host();
}

std::optional<std::string> NRequestUtils::originForRequest(const Pistache::Http::Request& req) {
    try {
        const auto ORIGIN = Pistache::Http::Header::header_cast<OriginHeader>(req.headers().get("Origin"));
        if (ORIGIN && !ORIGIN->origin().empty())
            return ORIGIN->origin();
    } catch (std::exception& e) {
        ; // no origin, same-origin or non-browser caller
    }

    return std::nullopt;
}

eGatewayMethod NRequestUtils::gatewayMethod(Pistache::Http::Method method) {
    switch (method) {
        case Pistache::Http::Method::Get: return GATEWAY_METHOD_GET;
        case Pistache::Http::Method::Post: return GATEWAY_METHOD_POST;
        case Pistache::Http::Method::Options: return GATEWAY_METHOD_OPTIONS;
        default: break;
    }

    return GATEWAY_METHOD_OTHER;
}

std::optional<Pistache::Http::Method> NRequestUtils::pistacheMethod(eGatewayMethod method) {
    switch (method) {
        case GATEWAY_METHOD_GET: return Pistache::Http::Method::Get;
        case GATEWAY_METHOD_POST: return Pistache::Http::Method::Post;
        case GATEWAY_METHOD_OPTIONS: return Pistache::Http::Method::Options;
        case GATEWAY_METHOD_OTHER: break;
    }

    return std::nullopt;
}

SGatewayRequest NRequestUtils::toGatewayRequest(const Pistache::Http::Request& req) {
    SGatewayRequest gatewayRequest;
    gatewayRequest.method     = gatewayMethod(req.method());
    gatewayRequest.methodName = Pistache::Http::methodString(req.method());
    gatewayRequest.resource   = req.resource();
    gatewayRequest.origin     = originForRequest(req);
    gatewayRequest.body       = req.body();
    gatewayRequest.ip         = ipForRequest(req);
    return gatewayRequest;
}
