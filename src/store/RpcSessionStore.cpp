#include "RpcSessionStore.hpp"

#include "../debug/log.hpp"
#include "../headers/apiKeyHeader.hpp"
#include "../headers/authorization.hpp"

#include <mutex>
#include <memory>
#include <optional>
#include <vector>

#include <fmt/format.h>
#include <glaze/glaze.hpp>
#include <pistache/client.h>
#include <pistache/http.h>

constexpr const size_t RPC_MAX_RESPONSE_SIZE = 1024 * 64;

static std::string describeException(std::exception_ptr e) {
    try {
        std::rethrow_exception(e);
    } catch (std::exception& e) { return e.what(); } catch (const std::string& e) {
        return e;
    } catch (const char* e) { return e; } catch (...) {
        return "unknown error";
    }
}

CRpcSessionStore::CRpcSessionStore(const SRpcSettings& settings) : m_settings(settings) {
    std::string base = m_settings.url;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }

    m_endpoint = fmt::format("{}/rest/v1/rpc/{}", base, m_settings.procedure);
}

const char* CRpcSessionStore::name() const {
    return "rpc";
}

std::string CRpcSessionStore::endpoint() const {
    return m_endpoint;
}

std::expected<bool, std::string> CRpcSessionStore::isSessionValid(const std::string& tokenHash) {
    const auto ARGS = glz::write_json(SValidateSessionArgs{.p_token_hash = tokenHash});
    if (!ARGS.has_value())
        return std::unexpected("failed to serialize rpc arguments");

    struct SCallState {
        std::mutex         mutex;
        bool               done = false;
        std::optional<int> code;
        std::string        body;
        std::string        error;
    };

    // outlives this call if the client reports back after we gave up waiting
    auto                                 state = std::make_shared<SCallState>();

    Pistache::Http::Experimental::Client client;
    client.init(Pistache::Http::Experimental::Client::options().threads(1).maxConnectionsPerHost(8).maxResponseSize(RPC_MAX_RESPONSE_SIZE));

    auto builder = client.prepareRequest(m_endpoint, Pistache::Http::Method::Post);
    builder.body(ARGS.value());
    builder.header<Pistache::Http::Header::ContentType>(Pistache::Http::Mime::MediaType("application/json"));
    builder.header(std::make_shared<ApiKeyHeader>(m_settings.apiKey));
    builder.header(std::make_shared<BearerAuthorizationHeader>(m_settings.serviceKey));
    builder.timeout(m_settings.timeout);

    Debug::log(TRACE, "RpcSessionStore: POST {}", m_endpoint);

    auto resp = builder.send();
    resp.then(
        [state](Pistache::Http::Response response) {
            std::lock_guard<std::mutex> lg(state->mutex);
            state->code = static_cast<int>(response.code());
            state->body = response.body();
            state->done = true;
        },
        [state](std::exception_ptr e) {
            std::lock_guard<std::mutex> lg(state->mutex);
            state->error = describeException(e);
            state->done  = true;
        });

    Pistache::Async::Barrier<Pistache::Http::Response> b(resp);
    b.wait_for(m_settings.timeout + std::chrono::seconds(1));

    client.shutdown();

    std::lock_guard<std::mutex> lg(state->mutex);

    if (!state->done)
        return std::unexpected(fmt::format("{} timed out after {}s", m_endpoint, m_settings.timeout.count()));

    if (!state->code.has_value())
        return std::unexpected(fmt::format("{} failed: {}", m_endpoint, state->error));

    if (*state->code < 200 || *state->code >= 300)
        return std::unexpected(fmt::format("{} returned HTTP {}", m_endpoint, *state->code));

    std::vector<SValidateSessionRow> rows;
    const auto                       ERR = glz::read<glz::opts{.error_on_unknown_keys = false}>(rows, state->body);
    if (ERR)
        return std::unexpected(fmt::format("{} returned an unexpected body: {}", m_endpoint, glz::format_error(ERR, state->body)));

    return !rows.empty() && rows.front().is_valid;
}
