// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include <trestle/infra/common/terminal.hpp>

namespace trestle::log {

//! \brief Available verbosity levels
enum class Level {
    kNone,      // Simple logging line with no severity (e.g. build info)
    kCritical,  // An error there's no way we can recover from
    kError,     // We encountered an error which we might be able to recover from
    kWarning,   // Something happened and user might have the possibility to amend the situation
    kInfo,      // Info messages on regular operations
    kDebug,     // Debug information
    kTrace      // Trace calls to functions
};

//! \brief Holds logging configuration
struct Settings {
    //! Whether console logging goes to std::cout or std::cerr (default)
    bool log_std_out{false};
    //! Whether timestamps should be in UTC or imbue local timezone
    bool log_utc{true};
    //! Whether to disable colorized output
    bool log_nocolor{false};
    //! Whether to print thread names in log lines
    bool log_threads{false};
    //! Log verbosity level
    Level log_verbosity{Level::kNone};
    //! Log to file
    std::string log_file;
};

//! \brief Initializes logging facilities
//! \note This function is not thread safe as it's meant to be used at start of process and never called again
void init(const Settings& settings = {});

//! \brief Get the current logging verbosity
Level get_verbosity();

//! \brief Sets logging verbosity
//! \note This function is not thread safe as it's meant to be used at start of process or in tests
void set_verbosity(Level level);

//! \brief Sets the name for this thread when logging traces also threads
void set_thread_name(const char* name);

//! \brief Checks if provided log level will be effectively printed on behalf of current settings
bool test_verbosity(Level level);

//! \brief Sets a file output for log teeing
void tee_file(const std::filesystem::path& path);

using Args = std::vector<std::string>;

class BufferBase {
  public:
    explicit BufferBase(Level level);
    BufferBase(Level level, std::string_view msg, const Args& args);
    ~BufferBase() { flush(); }

    BufferBase(const BufferBase&) = delete;
    BufferBase& operator=(const BufferBase&) = delete;

    template <class T>
    void append(const T& t) {
        if (should_print_) ss_ << t;
    }
    template <class T>
    BufferBase& operator<<(const T& t) {
        append(t);
        return *this;
    }
    BufferBase& operator<<(const Args& args) {
        append("", args);
        return *this;
    }

  protected:
    //! Message left aligned on a fixed width column, followed by key=value pairs
    void append(std::string_view msg, const Args& args) {
        if (!should_print_) return;
        ss_ << std::left << std::setw(36) << std::setfill(' ') << msg;
        for (size_t i{0}; i < args.size(); ++i) {
            const bool key{i % 2 == 0};
            ss_ << (key ? kColorGreen : kColorWhite) << args[i] << kColorReset << (key ? "=" : " ");
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

}  // namespace trestle::log

#define TRESTLE_LOGBUFFER(level_, ...)           \
    if (!trestle::log::test_verbosity(level_)) { \
    } else                                       \
        trestle::log::LogBuffer<level_>(__VA_ARGS__)

#define TRESTLE_TRACE_M(...) TRESTLE_LOGBUFFER(trestle::log::Level::kTrace, __VA_ARGS__)
#define TRESTLE_DEBUG_M(...) TRESTLE_LOGBUFFER(trestle::log::Level::kDebug, __VA_ARGS__)
#define TRESTLE_INFO_M(...) TRESTLE_LOGBUFFER(trestle::log::Level::kInfo, __VA_ARGS__)
#define TRESTLE_WARN_M(...) TRESTLE_LOGBUFFER(trestle::log::Level::kWarning, __VA_ARGS__)
#define TRESTLE_ERROR_M(...) TRESTLE_LOGBUFFER(trestle::log::Level::kError, __VA_ARGS__)
#define TRESTLE_CRIT_M(...) TRESTLE_LOGBUFFER(trestle::log::Level::kCritical, __VA_ARGS__)

#define TRESTLE_TRACE TRESTLE_TRACE_M()
#define TRESTLE_DEBUG TRESTLE_DEBUG_M()
#define TRESTLE_INFO TRESTLE_INFO_M()
#define TRESTLE_WARN TRESTLE_WARN_M()
#define TRESTLE_ERROR TRESTLE_ERROR_M()
#define TRESTLE_CRIT TRESTLE_CRIT_M()
