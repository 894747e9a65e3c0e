#pragma once

#include <string>
#include <expected>

// Read-only view of the session system of record.
class ISessionStore {
  public:
    virtual ~ISessionStore() = default;

    // true if a currently valid session exists for tokenHash, false if none does.
    // The error string is for server-side logs, never for clients.
    virtual std::expected<bool, std::string> isSessionValid(const std::string& tokenHash) = 0;

    virtual const char*                      name() const = 0;
};
