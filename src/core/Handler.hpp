#pragma once

#include <pistache/http.h>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "Gateway.hpp"

class CServerHandler : public Pistache::Http::Handler {

    HTTP_PROTOTYPE(CServerHandler)

  public:
    CServerHandler(std::shared_ptr<const CGateway> gateway, bool async);

    void onRequest(const Pistache::Http::Request& req, Pistache::Http::ResponseWriter response);

    void onTimeout(const Pistache::Http::Request& request, Pistache::Http::ResponseWriter response);

    size_t pendingRequests() const;

  private:
    struct SPendingRequest {
        SPendingRequest(SGatewayRequest r, Pistache::Http::ResponseWriter& resp) : req(std::move(r)), response(std::move(resp)) {
            ;
        }

        SGatewayRequest                req;
        Pistache::Http::ResponseWriter response;
        std::thread                    requestThread;
    };

    struct SPendingQueue {
        std::vector<std::shared_ptr<SPendingRequest>> queue;
        std::mutex                                    queueMutex;
    };

    void                                   handleAsync(SGatewayRequest req, Pistache::Http::ResponseWriter& response);

    static void                            handleInternal(const CGateway& gateway, const SGatewayRequest& req, Pistache::Http::ResponseWriter& response);
    static void                            sendResponse(const SGatewayResponse& gatewayResponse, Pistache::Http::ResponseWriter& response);

    std::shared_ptr<const CGateway>        m_gateway;
    bool                                   m_async = true;

    // shared between the clones pistache makes for each worker
    std::shared_ptr<SPendingQueue>         m_pending = std::make_shared<SPendingQueue>();
};
