// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include <filesystem>
#include <iomanip>
#include <iostream>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>

#include <unistd.h>

#include <CLI/CLI.hpp>
#include <intx/intx.hpp>
#include <magic_enum.hpp>

#include <strata/core/common/util.hpp>
#include <strata/db/kv/mdbx.hpp>
#include <strata/db/static_files/errors.hpp>
#include <strata/db/static_files/provider.hpp>
#include <strata/infra/cli/common.hpp>
#include <strata/infra/common/ensure.hpp>
#include <strata/infra/common/log.hpp>

using namespace strata;
using namespace strata::cmd::common;
using namespace strata::db::static_files;

//! The available subcommands in static files utility
//! \warning reducing the enum base type size as suggested by clang-tidy breaks CLI11
enum class StaticFilesTool {  // NOLINT(performance-enum-size)
    stats,
    check,
    lookup_header,
    lookup_txn,
    expire,
};

//! The settings for the static files toolbox
struct StaticFilesToolSettings {
    log::Settings log_settings;
    std::filesystem::path static_files_dir{"static_files"};
    uint64_t blocks_per_file{kDefaultBlocksPerFile};
    std::optional<std::filesystem::path> chaindata_dir;
    bool receipt_pruning{false};
    std::optional<std::string> lookup_hash;
    std::optional<uint64_t> lookup_number;
    BlockNum expire_below{0};
};

struct HashValidator : public CLI::Validator {
    explicit HashValidator() {
        func_ = [&](const std::string& value) -> std::string {
            const auto hash{Hash::from_hex(value)};
            if (!hash) return "Value " + value + " is not a valid 32-byte hash";
            return {};
        };
    }
};

//! Parse the command-line arguments into the static files toolbox settings
void parse_command_line(int argc, char* argv[], CLI::App& app, StaticFilesToolSettings& settings) {
    add_logging_options(app, settings.log_settings);

    std::map<StaticFilesTool, CLI::App*> commands;
    for (auto& [tool, name] : magic_enum::enum_entries<StaticFilesTool>()) {
        commands[tool] = app.add_subcommand(std::string{name});
    }
    app.require_subcommand(1);

    app.add_option("--static_files_dir", settings.static_files_dir, "Path to static files directory")
        ->capture_default_str()
        ->check(CLI::ExistingDirectory);
    app.add_option("--blocks_per_file", settings.blocks_per_file, "Number of blocks held by each static file")
        ->capture_default_str()
        ->check(CLI::Range(uint64_t{1}, uint64_t{100'000'000}));

    commands[StaticFilesTool::check]->description("Check static files against the key-value database");
    add_option_existing_dir(*commands[StaticFilesTool::check], "--chaindata", settings.chaindata_dir,
                            "Path to the key-value database directory");
    commands[StaticFilesTool::check]->add_flag("--receipt_pruning", settings.receipt_pruning,
                                               "Whether receipts are pruned, so receipt static files are not checked");

    for (auto& cmd : {commands[StaticFilesTool::lookup_header], commands[StaticFilesTool::lookup_txn]}) {
        cmd->add_option("--number", settings.lookup_number, "Block number (header) or transaction number (txn) to lookup");
        cmd->add_option("--hash", settings.lookup_hash, "Hash to lookup in static files")
            ->check(HashValidator{});
    }

    commands[StaticFilesTool::expire]->description("Delete transaction and receipt static files below a block");
    commands[StaticFilesTool::expire]->add_option("--below", settings.expire_below, "Block below which history is expired")
        ->required();

    app.parse(argc, argv);
}

static std::shared_ptr<StaticFileProvider> open_provider(const StaticFilesToolSettings& settings, StaticFileAccess access) {
    return StaticFileProvider::open(StaticFileSettings{
        .directory = settings.static_files_dir,
        .access = access,
        .blocks_per_file = settings.blocks_per_file,
    });
}

static std::string to_string(const std::optional<BlockNum>& block_num) {
    return block_num ? std::to_string(*block_num) : "-";
}

void stats(const StaticFilesToolSettings& settings) {
    const auto provider{open_provider(settings, StaticFileAccess::kReadOnly)};

    std::cout << "Static files in " << provider->directory().string() << "\n";
    for (const auto& segment_stats : provider->stats()) {
        const auto segment{segment_stats.segment};
        std::cout << std::left << std::setw(14) << to_string(segment)
                  << " jars=" << segment_stats.jars
                  << " rows=" << segment_stats.rows
                  << " lowest=" << to_string(provider->get_lowest_static_file_block(segment))
                  << " highest=" << to_string(provider->get_highest_static_file_block(segment))
                  << " data=" << human_size(segment_stats.data_size)
                  << " offsets=" << human_size(segment_stats.offsets_size)
                  << " index=" << human_size(segment_stats.index_size)
                  << " total=" << human_size(segment_stats.total_size()) << "\n";
    }
    std::cout << "Earliest history height: " << provider->earliest_history_height() << "\n";
}

//! \return true if the static files are consistent with the database
bool check(const StaticFilesToolSettings& settings) {
    ensure(settings.chaindata_dir.has_value(), "check: --chaindata must be specified");

    db::EnvConfig db_config{.path = settings.chaindata_dir->string(), .readonly = true};
    auto env{db::open_env(db_config)};
    db::ROTxn txn{env};

    const auto provider{open_provider(settings, StaticFileAccess::kReadOnly)};
    try {
        const auto unwind_target{provider->check_consistency(txn, settings.receipt_pruning)};
        if (unwind_target) {
            STRATA_WARN_M("Database must be unwound to match static files", {"target", std::to_string(*unwind_target)});
            return false;
        }
    } catch (const InconsistentJar& ex) {
        STRATA_ERROR_M("Static file is inconsistent", {"error", ex.what()});
        return false;
    } catch (const ReadOnlyStaticFileAccess& ex) {
        STRATA_ERROR_M("Static files are ahead of stage checkpoint", {"error", ex.what()});
        return false;
    }
    STRATA_INFO_M("Static files are consistent", {"highest", to_string(provider->get_highest_static_files().max_block_num())});
    return true;
}

void lookup_header(const StaticFilesToolSettings& settings) {
    ensure(settings.lookup_hash || settings.lookup_number, "lookup_header: either --hash or --number must be specified");
    const auto provider{open_provider(settings, StaticFileAccess::kReadOnly)};

    std::optional<BlockHeader> header;
    if (settings.lookup_hash) {
        header = provider->header(*Hash::from_hex(*settings.lookup_hash));
    } else {
        header = provider->header_by_number(*settings.lookup_number);
    }
    if (!header) {
        std::cout << "Header not found\n";
        return;
    }
    std::cout << "Header found:"
              << " number=" << header->number
              << " hash=" << to_hex(header->hash(), /*with_prefix=*/true)
              << " parent_hash=" << to_hex(header->parent_hash, /*with_prefix=*/true)
              << " timestamp=" << header->timestamp
              << " gas_used=" << header->gas_used << "\n";
}

void lookup_transaction(const StaticFilesToolSettings& settings) {
    ensure(settings.lookup_hash || settings.lookup_number, "lookup_txn: either --hash or --number must be specified");
    const auto provider{open_provider(settings, StaticFileAccess::kReadOnly)};

    std::optional<TxNum> tx_num{settings.lookup_number};
    if (settings.lookup_hash) {
        tx_num = provider->transaction_id(*Hash::from_hex(*settings.lookup_hash));
    }
    const auto transaction{tx_num ? provider->transaction_by_id(*tx_num) : std::nullopt};
    if (!transaction) {
        std::cout << "Transaction not found\n";
        return;
    }
    std::cout << "Transaction found:"
              << " tx_num=" << *tx_num
              << " block=" << to_string(provider->transaction_block(*tx_num))
              << " hash=" << to_hex(transaction->hash(), /*with_prefix=*/true)
              << " type=" << magic_enum::enum_name(transaction->type)
              << " nonce=" << transaction->nonce
              << " value=" << intx::to_string(transaction->value) << "\n";
}

void expire(const StaticFilesToolSettings& settings) {
    const auto provider{open_provider(settings, StaticFileAccess::kReadWrite)};
    const auto deleted{provider->delete_transactions_below(settings.expire_below)};
    for (const auto& header : deleted) {
        std::cout << "Deleted " << filename(header.segment(), header.expected_block_range()) << "\n";
    }
    std::cout << "Earliest history height: " << provider->earliest_history_height() << "\n";
}

int main(int argc, char* argv[]) {
    CLI::App app{"Static files toolbox"};

    try {
        StaticFilesToolSettings settings;
        parse_command_line(argc, argv, app, settings);

        log::init(settings.log_settings);

        const auto pid = ::getpid();
        STRATA_INFO_M("Static files toolbox starting", {"pid", std::to_string(pid)});

        const auto command_name = app.get_subcommands().front()->get_name();
        const auto tool = magic_enum::enum_cast<StaticFilesTool>(command_name).value();

        int exit_code{0};
        switch (tool) {
            case StaticFilesTool::stats:
                stats(settings);
                break;
            case StaticFilesTool::check:
                exit_code = check(settings) ? 0 : 1;
                break;
            case StaticFilesTool::lookup_header:
                lookup_header(settings);
                break;
            case StaticFilesTool::lookup_txn:
                lookup_transaction(settings);
                break;
            case StaticFilesTool::expire:
                expire(settings);
                break;
        }

        STRATA_INFO_M("Static files toolbox exiting", {"pid", std::to_string(pid)});
        return exit_code;
    } catch (const CLI::ParseError& pe) {
        return app.exit(pe);
    } catch (const std::exception& e) {
        STRATA_CRIT_M("Static files toolbox exiting due to exception", {"error", e.what()});
        return -2;
    }
}
