#include "OriginPolicy.hpp"

COriginPolicy::COriginPolicy(std::vector<std::shared_ptr<re2::RE2>> patterns) : m_patterns(std::move(patterns)) {
    ;
}

std::optional<std::string> COriginPolicy::allowedOrigin(const std::optional<std::string>& origin) const {
    if (!origin.has_value() || origin->empty() || *origin == "*")
        return std::nullopt;

    if (m_patterns.empty())
        return origin;

    for (const auto& re : m_patterns) {
        if (RE2::FullMatch(*origin, *re))
            return origin;
    }

    return std::nullopt;
}
