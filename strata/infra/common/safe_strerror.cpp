// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "safe_strerror.hpp"

#include <cstring>

namespace strata {

std::string safe_strerror(int err_code) {
    char msg[256];
#if defined(__GLIBC__) && defined(_GNU_SOURCE)
    // GNU variant may return a static string instead of filling the buffer
    const char* description{strerror_r(err_code, msg, sizeof(msg))};
    return {description != nullptr ? description : "Unknown error"};
#else
    if (strerror_r(err_code, msg, sizeof(msg))) {
        (void)strncpy(msg, "Unknown error", sizeof(msg));
    }
    msg[sizeof(msg) - 1] = '\0';
    return {msg};
#endif
}

}  // namespace strata
