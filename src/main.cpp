#include <algorithm>
#include <iostream>
#include <pistache/common.h>
#include <pistache/endpoint.h>
#include <pistache/http.h>
#include <pistache/http_headers.h>
#include <pistache/net.h>

#include "headers/forwardedIpHeaders.hpp"
#include "headers/originHeader.hpp"

#include "debug/log.hpp"

#include "core/Gateway.hpp"
#include "core/Handler.hpp"
#include "store/RpcSessionStore.hpp"
#include "store/SqliteSessionStore.hpp"
#include "logging/TrafficLogger.hpp"

#include "config/Config.hpp"

#include <signal.h>

static std::shared_ptr<ISessionStore> makeSessionStore() {
    const auto& STORE = g_pConfig->m_config.session_store;

    switch (g_pConfig->m_parsedConfigDatas.backend) {
        case SESSION_STORE_RPC: {
            if (STORE.url.empty() || STORE.service_key.empty()) {
                Debug::log(ERR, "Missing session store configuration (url / service key), every token request will fail");
                return nullptr;
            }

            auto rpc = std::make_shared<CRpcSessionStore>(CRpcSessionStore::SRpcSettings{
                .url        = STORE.url,
                .apiKey     = STORE.api_key,
                .serviceKey = STORE.service_key,
                .procedure  = STORE.procedure,
                .timeout    = std::chrono::seconds(STORE.timeout_sec),
            });
            Debug::log(LOG, "Validating sessions against {}", rpc->endpoint());
            return rpc;
        }
        case SESSION_STORE_SQLITE: {
            try {
                return std::make_shared<CSqliteSessionStore>(STORE.sqlite_path);
            } catch (std::exception& e) { Debug::die("Couldn't open the session database: {}", e.what()); }
        }
    }

    return nullptr;
}

int main(int argc, char** argv) {

    std::vector<std::string> ARGS{};
    ARGS.resize(argc);
    for (int i = 0; i < argc; ++i) {
        ARGS[i] = std::string{argv[i]};
    }

    std::string configPath;

    for (int i = 1; i < argc; ++i) {
        if (ARGS[i].starts_with("-")) {
            if (ARGS[i] == "--help" || ARGS[i] == "-h") {
                std::cout << "sessiongate " << SESSIONGATE_VERSION << "\n-c [config.jsonc]\n\nEnvironment overrides: PORT, COOKIE_NAME, COOKIE_DOMAIN, COOKIE_SECURE, "
                          << "COOKIE_SAME_SITE, COOKIE_MAX_AGE, SUPABASE_URL, SUPABASE_PUBLISHABLE_KEY, SUPABASE_SERVICE_ROLE_KEY, SESSION_STORE_SQLITE_PATH\n";
                return 0;
            } else if ((ARGS[i] == "--config" || ARGS[i] == "-c") && i + 1 < argc) {
                configPath = ARGS[i + 1];
                i++;
            } else {
                std::cerr << "Unrecognized / invalid use of option " << ARGS[i] << "\nContinuing...\n";
                continue;
            }
        } else
            std::cerr << "Ignoring stray argument " << ARGS[i] << "\n";
    }

    g_pConfig = std::make_unique<CConfig>(configPath);

    sigset_t signals;
    if (sigemptyset(&signals) != 0 || sigaddset(&signals, SIGTERM) != 0 || sigaddset(&signals, SIGINT) != 0 || sigaddset(&signals, SIGQUIT) != 0 ||
        sigaddset(&signals, SIGPIPE) != 0 || sigaddset(&signals, SIGALRM) != 0 || sigprocmask(SIG_BLOCK, &signals, nullptr) != 0)
        return 1;

    if (g_pConfig->m_config.logging.log_traffic)
        g_pTrafficLogger = std::make_unique<CTrafficLogger>(g_pConfig->m_config.logging.traffic_log_schema, g_pConfig->m_config.logging.traffic_log_file);

    auto gateway = std::make_shared<const CGateway>(
        CGateway::SGatewaySettings{
            .cookie          = g_pConfig->m_parsedConfigDatas.cookie,
            .origins         = COriginPolicy(g_pConfig->m_parsedConfigDatas.allowedOrigins),
            .preflightMaxAge = g_pConfig->m_config.cors.max_age_sec,
        },
        makeSessionStore());

    int               threads = std::max(1, g_pConfig->m_config.threads);
    Pistache::Address address = {Pistache::Ipv4::any(), (uint16_t)g_pConfig->m_config.port};
    Debug::log(LOG, "Starting sessiongate {} on {}:{}", SESSIONGATE_VERSION, address.host(), address.port().toString());

    Pistache::Http::Header::Registry::instance().registerHeader<CFConnectingIPHeader>();
    Pistache::Http::Header::Registry::instance().registerHeader<XRealIPHeader>();
    Pistache::Http::Header::Registry::instance().registerHeader<OriginHeader>();

    auto endpoint = std::make_unique<Pistache::Http::Endpoint>(address);
    auto opts     = Pistache::Http::Endpoint::options().threads(threads).flags(Pistache::Tcp::Options::ReuseAddr | Pistache::Tcp::Options::ReusePort);
    opts.maxRequestSize(g_pConfig->m_config.max_request_size);
    endpoint->init(opts);
    auto handler = Pistache::Http::make_handler<CServerHandler>(gateway, g_pConfig->m_config.async_validation);
    endpoint->setHandler(handler);

    endpoint->serveThreaded();

    bool terminate = false;
    while (!terminate) {
        int number = 0;
        int status = sigwait(&signals, &number);
        if (status != 0) {
            Debug::log(CRIT, "sigwait threw {} :(", status);
            break;
        }

        Debug::log(LOG, "Caught signal {}", number);

        switch (number) {
            case SIGINT: terminate = true; break;
            case SIGTERM: terminate = true; break;
            case SIGQUIT: terminate = true; break;
            case SIGPIPE: break;
            case SIGALRM: break;
        }
    }

    sigprocmask(SIG_UNBLOCK, &signals, nullptr);

    Debug::log(LOG, "Shutting down, {} requests still in flight, bye!", handler->pendingRequests());

    endpoint->shutdown();
    endpoint = nullptr;

    return 0;
}
