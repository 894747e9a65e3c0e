#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <re2/re2.h>

// Which Origin gets echoed back. Credentialed CORS never allows "*".
class COriginPolicy {
  public:
    // empty patterns echo any origin
    COriginPolicy(std::vector<std::shared_ptr<re2::RE2>> patterns = {});

    std::optional<std::string> allowedOrigin(const std::optional<std::string>& origin) const;

  private:
    std::vector<std::shared_ptr<re2::RE2>> m_patterns;
};
