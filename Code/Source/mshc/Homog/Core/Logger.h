/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#ifndef MSHC_HOMOG_LOGGER_H
#define MSHC_HOMOG_LOGGER_H

/**
 * @file Logger.h
 * @brief Logging for the homogenization library
 *
 * A process-wide logger with severity filtering, console and file sinks and
 * user handlers. Tensor entries may be evaluated from several OpenMP
 * threads, so records carry the OpenMP thread number and every sink write is
 * serialized. Records of an MPI run carry the rank.
 *
 * Output line:
 *
 *   [12:03:44.118] [R0] [T3] [INFO] TensorAssembler: 'E' (SymSym, dim 2): ...
 */

#include "Types.h"
#include "HomogConfig.h"

#include <chrono>
#include <fstream>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace mshc {
namespace Homog {

enum class LogLevel : int {
    DEBUG    = 0,
    INFO     = 1,
    WARNING  = 2,
    ERROR    = 3,
    CRITICAL = 4,
    OFF      = 5
};

const char* log_level_to_string(LogLevel level) noexcept;

/**
 * @brief Parse a level name (case-insensitive); returns false if unrecognized
 */
bool parse_log_level(const std::string& name, LogLevel& level);

/**
 * @brief One log record as passed to handlers
 */
struct LogMessage {
    LogLevel level{LogLevel::INFO};
    std::string message;
    std::string file;
    int line{0};
    std::chrono::system_clock::time_point timestamp;
    int mpi_rank{-1};        ///< -1 outside MPI runs
    int omp_thread{-1};      ///< -1 outside OpenMP parallel regions
};

class Logger {
public:
    using LogHandler = std::function<void(const LogMessage&)>;

    static Logger& instance();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void set_level(LogLevel level);
    LogLevel get_level() const;

    [[nodiscard]] bool enabled(LogLevel level) const;

    void set_console_output(bool enabled);

    /**
     * @brief Append records to @p filename; an empty name closes the file
     *
     * In MPI runs each rank writes to its own file (name_rank<r>.ext).
     */
    void set_file_output(const std::string& filename);

    void set_show_rank(bool show);
    void set_show_timestamp(bool show);

    /**
     * @brief Add a sink; handlers run with the logger lock held and must not log
     */
    void add_handler(LogHandler handler);
    void clear_handlers();

    void log(LogLevel level, const std::string& message,
             const char* file = "", int line = 0);

private:
    Logger() = default;
    ~Logger();

    std::string format(const LogMessage& msg) const;

    mutable std::mutex mutex_;
    LogLevel min_level_{LogLevel::INFO};
    bool console_output_{true};
    bool show_rank_{true};
    bool show_timestamp_{true};
    std::ofstream file_;
    std::vector<LogHandler> handlers_;
};

/**
 * @brief Logs "Starting: <name>" on construction and "Completed: <name>" with
 *        the elapsed time on destruction
 */
class ScopedTimer {
public:
    explicit ScopedTimer(std::string name, LogLevel level = LogLevel::INFO);
    ~ScopedTimer();

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

    [[nodiscard]] double elapsedSeconds() const;

private:
    std::string name_;
    LogLevel level_;
    std::chrono::steady_clock::time_point start_;
};

// ============================================================================
// Logging Macros
// ============================================================================

#define HOMOG_LOG(level, message) \
    mshc::Homog::Logger::instance().log(level, message, __FILE__, __LINE__)

#if HOMOG_DEBUG_MODE
    #define HOMOG_LOG_DEBUG(message) HOMOG_LOG(mshc::Homog::LogLevel::DEBUG, message)
#else
    #define HOMOG_LOG_DEBUG(message) ((void)0)
#endif

#define HOMOG_LOG_INFO(message) HOMOG_LOG(mshc::Homog::LogLevel::INFO, message)
#define HOMOG_LOG_WARNING(message) HOMOG_LOG(mshc::Homog::LogLevel::WARNING, message)
#define HOMOG_LOG_ERROR(message) HOMOG_LOG(mshc::Homog::LogLevel::ERROR, message)

#define HOMOG_LOG_CONCAT_INNER(a, b) a##b
#define HOMOG_LOG_CONCAT(a, b) HOMOG_LOG_CONCAT_INNER(a, b)

#define HOMOG_TIMED_SCOPE_LEVEL(name, level) \
    mshc::Homog::ScopedTimer HOMOG_LOG_CONCAT(homog_scoped_timer_, __LINE__)(name, level)

#define HOMOG_TIMED_SCOPE(name) HOMOG_TIMED_SCOPE_LEVEL(name, mshc::Homog::LogLevel::INFO)

} // namespace Homog
} // namespace mshc

#endif // MSHC_HOMOG_LOGGER_H
