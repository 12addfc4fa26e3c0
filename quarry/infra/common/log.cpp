// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "log.hpp"

#include <array>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <ostream>
#include <stdexcept>
#include <thread>
#include <utility>

#include <absl/strings/ascii.h>
#include <absl/time/clock.h>
#include <absl/time/time.h>

namespace quarry::log {

namespace {

    constexpr size_t kThreadNameFixedSize{11};

    //! Process wide output state, lines are written under the mutex
    struct Sink {
        Settings settings;
        bool is_terminal{false};
        std::mutex mutex;
        std::unique_ptr<std::ofstream> file;

        std::ostream& console() const { return settings.log_std_out ? std::cout : std::cerr; }
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

    // indexed by Level
    constexpr std::array<LevelStyle, 7> kLevelStyles{{
        {"     ", kColorReset},
        {" CRIT", kBackgroundRed},
        {"ERROR", kColorRed},
        {" WARN", kColorOrangeHigh},
        {" INFO", kColorGreen},
        {"DEBUG", kBackgroundPurple},
        {"TRACE", kColorCoal},
    }};

    struct SeparateThousands : std::numpunct<char> {
        explicit SeparateThousands(char sep) : separator{sep} {}
        char do_thousands_sep() const override { return separator; }
        string_type do_grouping() const override { return "\3"; }
        char separator;
    };

    std::string format_rate(double per_second) {
        std::ostringstream out;
        out << std::fixed << std::setprecision(per_second < 10 ? 2 : 0) << per_second << "/s";
        return out.str();
    }

}  // namespace

void init(const Settings& settings) {
    Sink& out{sink()};
    out.settings = settings;
    if (!settings.log_file.empty()) {
        tee_file(std::filesystem::path{settings.log_file});
    } else {
        out.file.reset();
    }
    out.is_terminal = settings.log_std_out ? is_terminal_stdout() : is_terminal_stderr();
    out.settings.log_nocolor = settings.log_nocolor || !out.is_terminal;
}

void tee_file(const std::filesystem::path& path) {
    auto file{std::make_unique<std::ofstream>(path, std::ios::out | std::ios::app)};
    if (!file->is_open()) {
        throw std::runtime_error("Could not open log file " + path.string());
    }
    std::scoped_lock lock{sink().mutex};
    sink().file = std::move(file);
}

Level get_verbosity() { return sink().settings.log_verbosity; }

void set_verbosity(Level level) { sink().settings.log_verbosity = level; }

bool test_verbosity(Level level) { return level <= sink().settings.log_verbosity; }

void set_thread_name(const char* name) {
    thread_name = name;
    thread_name.resize(kThreadNameFixedSize, ' ');
}

std::string get_thread_name() {
    if (thread_name.empty()) {
        std::ostringstream id;
        id << std::this_thread::get_id();
        thread_name = id.str();
    }
    return thread_name;
}

std::string strip_colors(std::string_view line) {
    std::string stripped;
    stripped.reserve(line.size());
    for (size_t i{0}; i < line.size(); ++i) {
        if (line[i] == '\x1b' && i + 1 < line.size() && line[i + 1] == '[') {
            size_t end{i + 2};
            while (end < line.size() && (absl::ascii_isdigit(static_cast<unsigned char>(line[end])) ||
                                         line[end] == ';')) {
                ++end;
            }
            if (end < line.size() && line[end] == 'm') {
                i = end;
                continue;
            }
        }
        stripped.push_back(line[i]);
    }
    return stripped;
}

BufferBase::BufferBase(Level level) : should_print_{test_verbosity(level)} {
    if (!should_print_) return;
    const Sink& out{sink()};
    const Settings& settings{out.settings};

    if (settings.log_thousands_sep != 0) {
        ss_.imbue(std::locale(ss_.getloc(), new SeparateThousands(settings.log_thousands_sep)));
    }

    const LevelStyle& style{kLevelStyles[static_cast<size_t>(level)]};
    if (settings.log_trim) {
        const std::string_view tag{absl::StripAsciiWhitespace(style.tag).substr(0, 4)};
        ss_ << kColorReset << (out.is_terminal ? "" : "[") << style.color << tag << kColorReset
            << (out.is_terminal ? "" : "] ");
    } else {
        ss_ << kColorReset << " " << style.color << style.tag << kColorReset << " ";
    }

    const absl::TimeZone tz{settings.log_utc ? absl::UTCTimeZone() : absl::LocalTimeZone()};
    ss_ << kColorWhite << "[" << absl::FormatTime("%m-%d|%H:%M:%E3S", absl::Now(), tz)
        << (settings.log_timezone ? " " + tz.name() : std::string{}) << "] " << kColorReset;

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
    const std::string line{ss_.str()};
    const std::string plain{strip_colors(line)};

    std::scoped_lock lock{out.mutex};
    out.console() << (out.settings.log_nocolor ? plain : line) << '\n';
    if (out.file && out.file->is_open()) {
        *out.file << plain << '\n';
    }
}

ProgressLog::ProgressLog(std::string title, uint64_t total, Clock::duration interval)
    : title_{std::move(title)},
      total_{total},
      interval_{interval},
      started_at_{Clock::now()},
      last_print_{started_at_} {}

bool ProgressLog::update(uint64_t done, const Args& extra) {
    done_ = done;
    const auto now{Clock::now()};
    if (now - last_print_ < interval_) {
        return false;
    }
    Args args{progress_args(now, last_print_done_, last_print_)};
    args.insert(args.end(), extra.begin(), extra.end());
    Info{title_, args};
    last_print_ = now;
    last_print_done_ = done;
    return true;
}

void ProgressLog::finish(const Args& extra) {
    Args args{progress_args(Clock::now(), 0, started_at_)};
    args.insert(args.end(), extra.begin(), extra.end());
    Info{title_ + " completed", args};
}

Args ProgressLog::progress_args(Clock::time_point now, uint64_t since_done, Clock::time_point since) const {
    const double seconds{std::chrono::duration<double>(now - since).count()};
    const double rate{seconds > 0 ? static_cast<double>(done_ - since_done) / seconds : 0.0};
    return {"done", std::to_string(done_), "total", std::to_string(total_), "rate", format_rate(rate)};
}

}  // namespace quarry::log
