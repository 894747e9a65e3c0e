#pragma once

#include <cstdint>

enum eSameSite : uint8_t {
    SAME_SITE_LAX = 0,
    SAME_SITE_STRICT,
    SAME_SITE_NONE,
};

enum eSessionStoreBackend : uint8_t {
    SESSION_STORE_RPC = 0,
    SESSION_STORE_SQLITE,
};
