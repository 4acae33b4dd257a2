// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include <strata/infra/common/terminal.hpp>

namespace strata::log {

//! Severity of a log line, ordered from the least to the most verbose
enum class Level {
    kNone,  // unconditional line without a severity tag
    kCritical,
    kError,
    kWarning,
    kInfo,
    kDebug,
    kTrace,
};

struct Settings {
    Level log_verbosity{Level::kInfo};
    //! Write to std::cout instead of std::cerr
    bool log_std_out{false};
    bool log_utc{true};
    //! Append the timezone name to timestamps
    bool log_timezone{true};
    bool log_nocolor{false};
    //! Shorten level tags to four letters
    bool log_trim{false};
    //! Prefix lines with the thread name
    bool log_threads{false};
    //! Also append every line to this file, colors stripped
    std::string log_file;
    //! Digit grouping separator for numbers streamed into log lines, zero to disable
    char log_thousands_sep{'\''};
};

//! \brief Applies the settings process-wide
//! \warning Not thread safe: call once at startup before any logging
void init(const Settings& settings = {});

Level get_verbosity();

//! \warning Not thread safe: meant for startup and tests
void set_verbosity(Level level);

//! \brief Whether a line at the given level would be printed
bool test_verbosity(Level level);

//! \brief Names the calling thread in log lines, padded to a fixed width
void set_thread_name(const char* name);

//! \return the name set for the calling thread, or its id if none was set
std::string get_thread_name();

//! \brief Duplicates log output into the given file, opened in append mode
//! \throws std::runtime_error if the file cannot be opened
void tee_file(const std::filesystem::path& path);

//! Alternating keys and values
using Args = std::vector<std::string>;

//! \brief One log line, formatted on construction and written out on destruction
class BufferBase {
  public:
    explicit BufferBase(Level level);
    BufferBase(Level level, std::string_view msg, const Args& args);
    ~BufferBase() { flush(); }

    BufferBase(const BufferBase&) = delete;
    BufferBase& operator=(const BufferBase&) = delete;

  protected:
    //! Message in a fixed-width column followed by key=value pairs
    void append(std::string_view msg, const Args& args) {
        if (!should_print_) return;
        ss_ << std::left << std::setw(41) << std::setfill(' ') << msg;
        for (size_t i{0}; i < args.size(); ++i) {
            const bool is_key{i % 2 == 0};
            ss_ << (is_key ? kColorGreen : kColorWhite) << args[i] << kColorReset << (is_key ? "=" : " ");
        }
    }
    void flush();

    const bool should_print_;
    std::stringstream ss_;
};

template <Level level>
class LogBuffer : public BufferBase {
  public:
    explicit LogBuffer(std::string_view msg, const Args& args = {}) : BufferBase(level, msg, args) {}
};

}  // namespace strata::log

// Arguments are not evaluated when the level is filtered out
#define STRATA_LOGBUFFER(level_, ...)           \
    if (!strata::log::test_verbosity(level_)) { \
    } else                                      \
        strata::log::LogBuffer<level_>(__VA_ARGS__)

#define STRATA_TRACE_M(...) STRATA_LOGBUFFER(strata::log::Level::kTrace, __VA_ARGS__)
#define STRATA_DEBUG_M(...) STRATA_LOGBUFFER(strata::log::Level::kDebug, __VA_ARGS__)
#define STRATA_INFO_M(...) STRATA_LOGBUFFER(strata::log::Level::kInfo, __VA_ARGS__)
#define STRATA_WARN_M(...) STRATA_LOGBUFFER(strata::log::Level::kWarning, __VA_ARGS__)
#define STRATA_ERROR_M(...) STRATA_LOGBUFFER(strata::log::Level::kError, __VA_ARGS__)
#define STRATA_CRIT_M(...) STRATA_LOGBUFFER(strata::log::Level::kCritical, __VA_ARGS__)
#define STRATA_LOG_M(...) STRATA_LOGBUFFER(strata::log::Level::kNone, __VA_ARGS__)
