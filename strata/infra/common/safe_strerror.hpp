// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string>

namespace strata {

//! \brief Thread-safe description of a system error code
std::string safe_strerror(int err_code);

}  // namespace strata
