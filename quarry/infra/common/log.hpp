// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include <quarry/infra/common/terminal.hpp>

namespace quarry::log {

//! \brief Verbosity levels, a line is printed when its level is lower than or equal to the configured one
enum class Level {
    kNone,      // no severity tag, always printed (e.g. build info)
    kCritical,  // unrecoverable, the process is about to stop
    kError,     // the current operation failed
    kWarning,   // skipped input or degraded behaviour
    kInfo,      // regular progress
    kDebug,
    kTrace,
};

struct Settings {
    bool log_std_out{false};   // std::cout instead of std::cerr
    bool log_utc{true};        // UTC timestamps instead of local time
    bool log_timezone{true};   // append the timezone name to timestamps
    bool log_nocolor{false};   // no ANSI colors, forced when the output is not a terminal
    bool log_trim{false};      // 4 letters level tags
    bool log_threads{false};   // prefix lines with the thread name
    Level log_verbosity{Level::kInfo};
    std::string log_file;          // tee every line to this file, colors stripped
    char log_thousands_sep{'\''};  // 0 disables digit grouping
};

//! \brief Initializes logging facilities
//! \note Not thread safe, meant to be called once at process start
void init(const Settings& settings = {});

Level get_verbosity();

//! \note Not thread safe, meant to be called at process start or from tests
void set_verbosity(Level level);

//! \brief Whether a line of this level would be printed, so callers can skip building it
bool test_verbosity(Level level);

//! \brief Names the calling thread in log lines when Settings::log_threads is set
void set_thread_name(const char* name);

//! \return The name set for the calling thread or its id
std::string get_thread_name();

//! \brief Tees the log lines to a file, appending
//! \remarks Throws std::runtime_error if the file cannot be opened
void tee_file(const std::filesystem::path& path);

//! \brief Removes the ANSI color escape sequences from a line
std::string strip_colors(std::string_view line);

//! \brief Flat list of alternating keys and values
using Args = std::vector<std::string>;

//! \brief Accumulates one log line and prints it on destruction
class BufferBase {
  public:
    explicit BufferBase(Level level);
    explicit BufferBase(Level level, std::string_view msg, const Args& args);
    ~BufferBase() { flush(); }

    template <class T>
    void append(const T& t) {
        if (should_print_) ss_ << t;
    }
    template <class T>
    BufferBase& operator<<(const T& t) {
        append(t);
        return *this;
    }
    void append(const Args& args) { append("", args); }
    BufferBase& operator<<(const Args& args) {
        append(args);
        return *this;
    }

  protected:
    //! Message padded to a fixed column followed by key=value pairs, a trailing key gets an empty value
    void append(std::string_view msg, const Args& args) {
        if (!should_print_) return;
        ss_ << std::left << std::setw(41) << std::setfill(' ') << msg;
        for (size_t i{0}; i < args.size(); i += 2) {
            ss_ << kColorGreen << args[i] << kColorReset << "=" << kColorWhite
                << (i + 1 < args.size() ? args[i + 1] : std::string{}) << kColorReset << " ";
        }
    }
    void flush();

    const bool should_print_;
    std::stringstream ss_;
};

template <Level level>
class LogBuffer : public BufferBase {
  public:
    explicit LogBuffer() : BufferBase(level) {}
    explicit LogBuffer(std::string_view msg, const Args& args = {}) : BufferBase(level, msg, args) {}
};

using Trace = LogBuffer<Level::kTrace>;
using Debug = LogBuffer<Level::kDebug>;
using Info = LogBuffer<Level::kInfo>;
using Warning = LogBuffer<Level::kWarning>;
using Error = LogBuffer<Level::kError>;
using Critical = LogBuffer<Level::kCritical>;
using Message = LogBuffer<Level::kNone>;

//! \brief Progress reporting for long loops (reindex, unwind, bulk ingestion)
//! \details update() prints an info line at most once per interval with the items done, the total and the
//! throughput since the previous line; finish() always prints the summary line
class ProgressLog {
  public:
    using Clock = std::chrono::steady_clock;

    ProgressLog(std::string title, uint64_t total, Clock::duration interval = std::chrono::seconds{5});

    //! \return true if a line has been printed
    bool update(uint64_t done, const Args& extra = {});
    void finish(const Args& extra = {});

    uint64_t done() const { return done_; }

  private:
    Args progress_args(Clock::time_point now, uint64_t since_done, Clock::time_point since) const;

    const std::string title_;
    const uint64_t total_;
    const Clock::duration interval_;
    const Clock::time_point started_at_;
    Clock::time_point last_print_;
    uint64_t last_print_done_{0};
    uint64_t done_{0};
};

}  // namespace quarry::log

#define QUARRY_LOGBUFFER(level_, ...)           \
    if (!quarry::log::test_verbosity(level_)) { \
    } else                                      \
        quarry::log::LogBuffer<level_>(__VA_ARGS__)

#define QUARRY_TRACE_M(...) QUARRY_LOGBUFFER(quarry::log::Level::kTrace, __VA_ARGS__)
#define QUARRY_DEBUG_M(...) QUARRY_LOGBUFFER(quarry::log::Level::kDebug, __VA_ARGS__)
#define QUARRY_INFO_M(...) QUARRY_LOGBUFFER(quarry::log::Level::kInfo, __VA_ARGS__)
#define QUARRY_WARN_M(...) QUARRY_LOGBUFFER(quarry::log::Level::kWarning, __VA_ARGS__)
#define QUARRY_ERROR_M(...) QUARRY_LOGBUFFER(quarry::log::Level::kError, __VA_ARGS__)
#define QUARRY_CRIT_M(...) QUARRY_LOGBUFFER(quarry::log::Level::kCritical, __VA_ARGS__)
#define QUARRY_LOG_M(...) QUARRY_LOGBUFFER(quarry::log::Level::kNone, __VA_ARGS__)

#define QUARRY_TRACE QUARRY_TRACE_M()
#define QUARRY_DEBUG QUARRY_DEBUG_M()
#define QUARRY_INFO QUARRY_INFO_M()
#define QUARRY_WARN QUARRY_WARN_M()
#define QUARRY_ERROR QUARRY_ERROR_M()
#define QUARRY_CRIT QUARRY_CRIT_M()
#define QUARRY_LOG QUARRY_LOG_M()
