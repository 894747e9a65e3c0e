#pragma once

#include <pistache/http_headers.h>
#include <pistache/net.h>

class VaryHeader : public Pistache::Http::Header::Header {
  public:
    NAME("Vary");

    VaryHeader() = default;
    VaryHeader(const std::string& value) : m_fields(value) {
        ;
    }

    void parse(const std::string& str) override {
        m_fields = str;
    }

    void write(std::ostream& os) const override {
        os << m_fields;
    }

    std::string fields() const {
        return m_fields;
    }

  private:
    std::string m_fields = "";
};
