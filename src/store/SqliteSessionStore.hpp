#pragma once

#include <sqlite3.h>
#include <string>
#include <vector>

#include "SessionStore.hpp"

/*
    Expects a table filled by whoever creates the sessions:

    CREATE TABLE sessions (
        token_hash TEXT NOT NULL,
        expires_at INTEGER NOT NULL,
        revoked INTEGER NOT NULL DEFAULT 0,
        CONSTRAINT PK PRIMARY KEY (token_hash)
    );

    The database is opened read-only.
*/
class CSqliteSessionStore : public ISessionStore {
  public:
    CSqliteSessionStore(const std::string& path);
    ~CSqliteSessionStore();

    CSqliteSessionStore(const CSqliteSessionStore&)            = delete;
    CSqliteSessionStore& operator=(const CSqliteSessionStore&) = delete;

    std::expected<bool, std::string> isSessionValid(const std::string& tokenHash) override;
    const char*                      name() const override;

  private:
    struct SQueryResult {
        std::vector<std::string> result;
    };

    sqlite3* m_db = nullptr;
};
