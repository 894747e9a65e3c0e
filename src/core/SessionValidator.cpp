#include "SessionValidator.hpp"

#include "TokenDigest.hpp"
#include "../debug/log.hpp"

const char* validationOutcomeToString(eValidationOutcome outcome) {
    switch (outcome) {
        case VALIDATION_VALID: return "VALID";
        case VALIDATION_INVALID: return "INVALID";
        case VALIDATION_STORE_UNAVAILABLE: return "STORE_UNAVAILABLE";
    }

    return "ERROR";
}

CSessionValidator::CSessionValidator(std::shared_ptr<ISessionStore> store) : m_store(std::move(store)) {
    ;
}

eValidationOutcome CSessionValidator::validate(const std::optional<std::string>& credential) const {
    if (!credential.has_value() || credential->empty())
        return VALIDATION_INVALID;

    if (!m_store) {
        Debug::log(ERR, "SessionValidator: no session store");
        return VALIDATION_STORE_UNAVAILABLE;
    }

    const auto DIGEST = NTokenDigest::digest(*credential);

    Debug::log(TRACE, "SessionValidator: looking up {}... in {}", DIGEST.substr(0, 8), m_store->name());

    std::expected<bool, std::string> result;
    try {
        result = m_store->isSessionValid(DIGEST);
    } catch (std::exception& e) { result = std::unexpected(fmt::format("exception: {}", e.what())); }

    // a failed lookup says nothing about the token, it must not read as a revocation
    if (!result.has_value()) {
        Debug::log(ERR, "SessionValidator: {} store lookup failed: {}", m_store->name(), result.error());
        return VALIDATION_STORE_UNAVAILABLE;
    }

    return result.value() ? VALIDATION_VALID : VALIDATION_INVALID;
}
