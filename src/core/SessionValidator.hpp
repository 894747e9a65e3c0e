#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "../store/SessionStore.hpp"

enum eValidationOutcome : uint8_t {
    VALIDATION_VALID = 0,
    VALIDATION_INVALID,
    VALIDATION_STORE_UNAVAILABLE,
};

const char* validationOutcomeToString(eValidationOutcome outcome);

class CSessionValidator {
  public:
    CSessionValidator(std::shared_ptr<ISessionStore> store);

    // An absent credential (missing, null, not a string) and an empty one are both
    // Invalid and never reach the store.
    eValidationOutcome validate(const std::optional<std::string>& credential) const;

  private:
    std::shared_ptr<ISessionStore> m_store;
};
