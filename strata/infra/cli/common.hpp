// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>
#include <optional>

#include <CLI/CLI.hpp>

#include <strata/infra/common/log.hpp>

namespace strata::cmd::common {

//! \brief Set up options to populate log settings after cli.parse()
void add_logging_options(CLI::App& cli, log::Settings& log_settings);

//! \brief Set up option for an optional existing directory path
void add_option_existing_dir(CLI::App& cli, const std::string& name, std::optional<std::filesystem::path>& dir,
                             const std::string& description);

}  // namespace strata::cmd::common
