#pragma once

#include <pistache/http_headers.h>
#include <pistache/net.h>

class AccessControlAllowCredentialsHeader : public Pistache::Http::Header::Header {
  public:
    NAME("Access-Control-Allow-Credentials");

    AccessControlAllowCredentialsHeader(bool allow = true) : m_allow(allow) {
        ;
    }

    void parse(const std::string& str) override {
        m_allow = str == "true";
    }

    void write(std::ostream& os) const override {
        os << (m_allow ? "true" : "false");
    }

    bool allow() const {
        return m_allow;
    }

  private:
    bool m_allow = true;
};
