#include "SqliteSessionStore.hpp"

#include "../core/TokenDigest.hpp"
#include "../debug/log.hpp"

#include <chrono>
#include <filesystem>
#include <stdexcept>

#include <fmt/format.h>

CSqliteSessionStore::CSqliteSessionStore(const std::string& path) {
    if (path.empty() || !std::filesystem::exists(path))
        throw std::runtime_error(fmt::format("session database {} does not exist", path));

    if (sqlite3_open_v2(path.c_str(), &m_db, SQLITE_OPEN_READONLY | SQLITE_OPEN_FULLMUTEX, nullptr) != SQLITE_OK) {
        const std::string ERR = m_db ? sqlite3_errmsg(m_db) : "out of memory";
        sqlite3_close(m_db);
        m_db = nullptr;
        throw std::runtime_error(fmt::format("failed to open sqlite3 db {}: {}", path, ERR));
    }

    Debug::log(LOG, "Opened session database {}", path);
}

CSqliteSessionStore::~CSqliteSessionStore() {
    if (m_db)
        sqlite3_close(m_db);
}

const char* CSqliteSessionStore::name() const {
    return "sqlite";
}

std::expected<bool, std::string> CSqliteSessionStore::isSessionValid(const std::string& tokenHash) {
    // only digests ever reach the query text
    if (!NTokenDigest::isDigest(tokenHash))
        return false;

    const auto        NOW = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count();

    const std::string CMD = fmt::format(R"#(
SELECT token_hash FROM sessions WHERE token_hash = '{}' AND revoked = 0 AND expires_at > {};
)#",
                                        tokenHash, NOW);

    char*             errmsg = nullptr;
    SQueryResult      result;

    sqlite3_exec(
        m_db, CMD.c_str(),
        [](void* result, int len, char** a, char**) -> int {
            auto res = reinterpret_cast<CSqliteSessionStore::SQueryResult*>(result);

            for (int i = 0; i < len; ++i) {
                res->result.push_back(a[i] ? a[i] : "");
            }

            return 0;
        },
        &result, &errmsg);

    if (errmsg) {
        std::string err = errmsg;
        sqlite3_free(errmsg);
        return std::unexpected(fmt::format("sqlite3 error: {}", err));
    }

    return !result.result.empty();
}
