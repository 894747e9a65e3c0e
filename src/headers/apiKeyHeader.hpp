#pragma once

#include <pistache/http_headers.h>
#include <pistache/net.h>

class ApiKeyHeader : public Pistache::Http::Header::Header {
  public:
    NAME("apikey");

    ApiKeyHeader() = default;
    ApiKeyHeader(const std::string& value) : m_key(value) {
        ;
    }

    void parse(const std::string& str) override {
        m_key = str;
    }

    void write(std::ostream& os) const override {
        os << m_key;
    }

    std::string key() const {
        return m_key;
    }

  private:
    std::string m_key = "";
};
