// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "log.hpp"

#include <array>
#include <fstream>
#include <iostream>
#include <locale>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>

#include <absl/strings/ascii.h>
#include <absl/time/clock.h>
#include <absl/time/time.h>

namespace strata::log {

namespace {

    //! Thread names are padded to this width so that log columns stay aligned
    constexpr size_t kThreadNameWidth = 11;

    //! Where formatted lines end up, shared by all threads
    struct Sink {
        Settings settings;
        bool terminal_output{false};
        std::unique_ptr<std::ofstream> tee;
        std::mutex mutex;
    };

    Sink& sink() {
        static Sink instance;
        return instance;
    }

    thread_local std::string thread_name;

    struct LevelStyle {
        std::string_view tag;
        std::string_view color;
    };

    //! Indexed by Level
    constexpr std::array<LevelStyle, 7> kLevelStyles{{
        {"     ", kColorReset},
        {" CRIT", kBackgroundRed},
        {"ERROR", kColorRed},
        {" WARN", kColorOrangeHigh},
        {" INFO", kColorGreen},
        {"DEBUG", kBackgroundPurple},
        {"TRACE", kColorCoal},
    }};

    LevelStyle style_of(Level level) {
        const auto index{static_cast<size_t>(level)};
        return index < kLevelStyles.size() ? kLevelStyles[index] : kLevelStyles[0];
    }

    //! Removes ANSI SGR sequences (ESC [ digits/semicolons m) from a line
    std::string strip_colors(std::string_view line) {
        std::string plain;
        plain.reserve(line.size());
        for (size_t i{0}; i < line.size(); ++i) {
            if (line[i] == '\x1b' && i + 1 < line.size() && line[i + 1] == '[') {
                size_t j{i + 2};
                while (j < line.size() && (absl::ascii_isdigit(static_cast<unsigned char>(line[j])) || line[j] == ';')) ++j;
                if (j < line.size() && line[j] == 'm' && j > i + 2) {
                    i = j;
                    continue;
                }
            }
            plain.push_back(line[i]);
        }
        return plain;
    }

    struct ThousandsGrouping : std::numpunct<char> {
        explicit ThousandsGrouping(char sep) : sep_{sep} {}
        char do_thousands_sep() const override { return sep_; }
        string_type do_grouping() const override { return "\3"; }

      private:
        char sep_;
    };

}  // namespace

void init(const Settings& settings) {
    Sink& out{sink()};
    out.settings = settings;
    if (!settings.log_file.empty()) {
        tee_file(settings.log_file);
        // escape sequences must never reach the tee file
        out.settings.log_nocolor = true;
    }
    out.terminal_output = settings.log_std_out ? is_terminal_stdout() : is_terminal_stderr();
    if (!out.terminal_output) {
        out.settings.log_nocolor = true;
    }
}

void tee_file(const std::filesystem::path& path) {
    auto file{std::make_unique<std::ofstream>(path, std::ios::out | std::ios::app)};
    if (!file->is_open()) {
        throw std::runtime_error("Could not open log file " + path.string());
    }
    sink().tee = std::move(file);
}

Level get_verbosity() { return sink().settings.log_verbosity; }

void set_verbosity(Level level) { sink().settings.log_verbosity = level; }

bool test_verbosity(Level level) { return level <= sink().settings.log_verbosity; }

void set_thread_name(const char* name) {
    thread_name = name;
    thread_name.resize(kThreadNameWidth, ' ');
}

std::string get_thread_name() {
    if (thread_name.empty()) {
        std::ostringstream id;
        id << std::this_thread::get_id();
        thread_name = id.str();
    }
    return thread_name;
}

BufferBase::BufferBase(Level level) : should_print_(test_verbosity(level)) {
    if (!should_print_) return;

    const Settings& settings{sink().settings};
    if (settings.log_thousands_sep != 0) {
        ss_.imbue(std::locale(ss_.getloc(), new ThousandsGrouping(settings.log_thousands_sep)));
    }

    const auto [tag, color] = style_of(level);
    if (settings.log_trim) {
        const bool bracketed{!sink().terminal_output};
        ss_ << kColorReset << (bracketed ? "[" : "") << color << absl::StripAsciiWhitespace(tag).substr(0, 4)
            << kColorReset << (bracketed ? "] " : "");
    } else {
        ss_ << kColorReset << " " << color << tag << kColorReset << " ";
    }

    static const absl::TimeZone kZone{settings.log_utc ? absl::UTCTimeZone() : absl::LocalTimeZone()};
    ss_ << kColorWhite << "[" << absl::FormatTime("%m-%d|%H:%M:%E3S", absl::Now(), kZone);
    if (settings.log_timezone) {
        ss_ << " " << kZone.name();
    }
    ss_ << "] " << kColorReset;

    if (settings.log_threads) {
        ss_ << "[" << get_thread_name() << "] ";
    }
}

BufferBase::BufferBase(Level level, std::string_view msg, const Args& args) : BufferBase(level) {
    append(msg, args);
}

void BufferBase::flush() {
    if (!should_print_) return;

    Sink& out{sink()};
    const std::string colored{ss_.str()};
    const std::string plain{strip_colors(colored)};

    std::scoped_lock lock{out.mutex};
    std::ostream& console{out.settings.log_std_out ? std::cout : std::cerr};
    console << (out.settings.log_nocolor ? plain : colored) << '\n';
    if (out.tee) {
        *out.tee << plain << '\n';
    }
}

}  // namespace strata::log
