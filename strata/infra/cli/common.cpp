// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "common.hpp"

#include <map>
#include <string>

namespace strata::cmd::common {

//! CLI11 validator for an optional directory, checking that the folder exists if specified
struct OptionalExistingDirectory : public CLI::detail::ExistingDirectoryValidator {
    explicit OptionalExistingDirectory() {
        func_ = [](const std::string& value) -> std::string {
            if (value.empty()) return {};

            const auto path_result = CLI::detail::check_path(value.c_str());
            if (path_result == CLI::detail::path_type::nonexistent) {
                return "Directory does not exist: " + value;
            }
            if (path_result == CLI::detail::path_type::file) {
                return "Directory is actually a file: " + value;
            }
            return {};
        };
    }
};

void add_logging_options(CLI::App& cli, log::Settings& log_settings) {
    std::map<std::string, log::Level> level_mapping{
        {"critical", log::Level::kCritical},
        {"error", log::Level::kError},
        {"warning", log::Level::kWarning},
        {"info", log::Level::kInfo},
        {"debug", log::Level::kDebug},
        {"trace", log::Level::kTrace},
    };
    auto& log_opts = *cli.add_option_group("Log", "Logging options");
    log_opts.add_option("--log.verbosity", log_settings.log_verbosity, "Sets log verbosity")
        ->check(CLI::Range(log::Level::kCritical, log::Level::kTrace))
        ->transform(CLI::Transformer(level_mapping, CLI::ignore_case))
        ->default_val(log::Level::kInfo);
    log_opts.add_flag("--log.stdout", log_settings.log_std_out, "Outputs to std::out instead of std::err");
    log_opts.add_flag("--log.nocolor", log_settings.log_nocolor, "Disable colors on log lines");
    log_opts.add_flag("--log.utc", log_settings.log_utc, "Prints log timings in UTC");
    log_opts.add_flag("--log.threads", log_settings.log_threads, "Prints thread ids");
    log_opts.add_option("--log.file", log_settings.log_file, "Tee all log lines to given file name");
}

void add_option_existing_dir(CLI::App& cli, const std::string& name, std::optional<std::filesystem::path>& dir,
                             const std::string& description) {
    cli.add_option(name, dir, description)
        ->check(OptionalExistingDirectory{});
}

}  // namespace strata::cmd::common
