#pragma once

#include <pistache/http_headers.h>
#include <pistache/net.h>

// outgoing "Authorization: Bearer <key>" for store calls
class BearerAuthorizationHeader : public Pistache::Http::Header::Header {
  public:
    NAME("Authorization");

    BearerAuthorizationHeader(const std::string& token = "") : m_token(token) {
        ;
    }

    void parse(const std::string& str) override {
        m_token = str.starts_with("Bearer ") ? str.substr(7) : str;
    }

    void write(std::ostream& os) const override {
        os << "Bearer " << m_token;
    }

    std::string token() const {
        return m_token;
    }

  private:
    std::string m_token = "";
};
