#include "Handler.hpp"
#include "../headers/accessControlAllowCredentialsHeader.hpp"
#include "../headers/accessControlMaxAgeHeader.hpp"
#include "../headers/setCookieHeader.hpp"
#include "../headers/varyHeader.hpp"
#include "../debug/log.hpp"
#include "../helpers/RequestUtils.hpp"
#include "../logging/TrafficLogger.hpp"

#include <thread>

static void logSendFailure(std::exception_ptr e) {
    try {
        std::rethrow_exception(e);
    } catch (std::exception& e) { Debug::log(ERR, "Failed to send response: {}", e.what()); } catch (...) {
        Debug::log(ERR, "Failed to send response: God knows why.");
    }
}

CServerHandler::CServerHandler(std::shared_ptr<const CGateway> gateway, bool async) : m_gateway(std::move(gateway)), m_async(async) {
    ;
}

void CServerHandler::onRequest(const Pistache::Http::Request& req, Pistache::Http::ResponseWriter response) {
    auto gatewayRequest = NRequestUtils::toGatewayRequest(req);

    Debug::log(LOG, "New request: {} {}", gatewayRequest.methodName, gatewayRequest.resource);
    Debug::log(LOG, " | Request author: IP {}, direct: {}, origin: {}", gatewayRequest.ip, req.address().host(), gatewayRequest.origin.value_or("<none>"));

    if (m_async) {
        handleAsync(std::move(gatewayRequest), response);
        return;
    }

    handleInternal(*m_gateway, gatewayRequest, response);
}

void CServerHandler::onTimeout(const Pistache::Http::Request& request, Pistache::Http::ResponseWriter response) {
    response.send(Pistache::Http::Code::Request_Timeout, "Timeout").then([=](ssize_t) {}, logSendFailure);
}

size_t CServerHandler::pendingRequests() const {
    std::lock_guard<std::mutex> lg(m_pending->queueMutex);
    return m_pending->queue.size();
}

void CServerHandler::handleAsync(SGatewayRequest req, Pistache::Http::ResponseWriter& response) {
    std::shared_ptr<SPendingRequest> pendingRequest;
    {
        std::lock_guard<std::mutex> lg(m_pending->queueMutex);
        pendingRequest = m_pending->queue.emplace_back(std::make_shared<SPendingRequest>(std::move(req), response));
        Debug::log(TRACE, "handleAsync: new request, queue size {}", m_pending->queue.size());
    }

    // the store lookup blocks, keep it off the reactor thread
    pendingRequest->requestThread = std::thread([pendingRequest, gateway = m_gateway, pending = m_pending]() {
        handleInternal(*gateway, pendingRequest->req, pendingRequest->response);
        std::lock_guard<std::mutex> lg(pending->queueMutex);
        std::erase(pending->queue, pendingRequest);
        Debug::log(TRACE, "handleAsync: request done, queue size {}", pending->queue.size());
    });
    pendingRequest->requestThread.detach();
}

void CServerHandler::handleInternal(const CGateway& gateway, const SGatewayRequest& req, Pistache::Http::ResponseWriter& response) {
    const auto GATEWAY_RESPONSE = gateway.handle(req);

    sendResponse(GATEWAY_RESPONSE, response);

    if (g_pTrafficLogger)
        g_pTrafficLogger->logTraffic(req, GATEWAY_RESPONSE);
}

void CServerHandler::sendResponse(const SGatewayResponse& gatewayResponse, Pistache::Http::ResponseWriter& response) {
    auto& headers = response.headers();

    if (gatewayResponse.allowOrigin.has_value())
        headers.add<Pistache::Http::Header::AccessControlAllowOrigin>(*gatewayResponse.allowOrigin);
    if (gatewayResponse.allowCredentials)
        headers.add(std::make_shared<AccessControlAllowCredentialsHeader>(true));
    if (gatewayResponse.varyOrigin)
        headers.add(std::make_shared<VaryHeader>("Origin"));
    if (gatewayResponse.allowMethods.has_value())
        headers.add<Pistache::Http::Header::AccessControlAllowMethods>(*gatewayResponse.allowMethods);
    if (gatewayResponse.allowHeaders.has_value())
        headers.add<Pistache::Http::Header::AccessControlAllowHeaders>(*gatewayResponse.allowHeaders);
    if (gatewayResponse.maxAge.has_value())
        headers.add(std::make_shared<AccessControlMaxAgeHeader>(*gatewayResponse.maxAge));
    if (!gatewayResponse.allow.empty()) {
        std::vector<Pistache::Http::Method> methods;
        for (const auto& m : gatewayResponse.allow) {
            if (const auto METHOD = NRequestUtils::pistacheMethod(m); METHOD.has_value())
                methods.emplace_back(*METHOD);
        }
        headers.add<Pistache::Http::Header::Allow>(methods);
    }
    if (gatewayResponse.setCookie.has_value())
        headers.add(std::make_shared<SetCookieHeader>(*gatewayResponse.setCookie));

    if (gatewayResponse.json)
        response.setMime(Pistache::Http::Mime::MediaType("application/json"));

    Debug::log(LOG, " | Response: {} ({})", gatewayResponse.code, gatewayOutcomeToString(gatewayResponse.outcome));

    response.send(static_cast<Pistache::Http::Code>(gatewayResponse.code), gatewayResponse.body).then([](ssize_t) {}, logSendFailure);
}
