#pragma once

#include <pistache/http_headers.h>
#include <pistache/net.h>

class AccessControlMaxAgeHeader : public Pistache::Http::Header::Header {
  public:
    NAME("Access-Control-Max-Age");

    AccessControlMaxAgeHeader(int seconds = 0) : m_seconds(seconds) {
        ;
    }

    void parse(const std::string& str) override {
        try {
            m_seconds = std::stoi(str);
        } catch (std::exception& e) { m_seconds = 0; }
    }

    void write(std::ostream& os) const override {
        os << m_seconds;
    }

    int seconds() const {
        return m_seconds;
    }

  private:
    int m_seconds = 0;
};
