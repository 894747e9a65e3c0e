#pragma once

#include <pistache/http_headers.h>
#include <pistache/net.h>

// Client address as reported by a reverse proxy in front of the gateway
class CForwardedIPHeader : public Pistache::Http::Header::Header {
  public:
    void parse(const std::string& str) override {
        m_ip = str;
    }

    void write(std::ostream& os) const override {
        os << m_ip;
    }

    std::string ip() const {
        return m_ip;
    }

  private:
    std::string m_ip = "";
};

class CFConnectingIPHeader : public CForwardedIPHeader {
  public:
    NAME("cf-connecting-ip");
};

class XRealIPHeader : public CForwardedIPHeader {
  public:
    NAME("X-Real-IP");
};
