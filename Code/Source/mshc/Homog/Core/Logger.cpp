/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

/**
 * @file Logger.cpp
 * @brief Logger implementation and environment-driven initialization
 *
 * Recognized variables, read once when the library is loaded:
 *   HOMOG_LOG_LEVEL      DEBUG | INFO | WARNING | ERROR | CRITICAL | OFF
 *   HOMOG_LOG_FILE       append output to this file
 *   HOMOG_LOG_CONSOLE    false/0 disables console output
 *   HOMOG_LOG_SHOW_RANK  false/0 hides the MPI rank prefix
 *   HOMOG_LOG_SHOW_TIME  false/0 hides timestamps
 */

#include "Logger.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <utility>

#if HOMOG_HAS_MPI
#include <mpi.h>
#endif

#ifdef _OPENMP
#include <omp.h>
#endif

namespace mshc {
namespace Homog {

namespace {

std::string to_lower(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool env_flag_enabled(const char* value)
{
    const std::string flag = to_lower(value);
    return flag != "false" && flag != "0";
}

int current_mpi_rank()
{
    int rank = -1;
#if HOMOG_HAS_MPI
    int initialized = 0;
    MPI_Initialized(&initialized);
    if (initialized) {
        MPI_Comm_rank(MPI_COMM_WORLD, &rank);
    }
#endif
    return rank;
}

int current_omp_thread()
{
#ifdef _OPENMP
    if (omp_in_parallel()) {
        return omp_get_thread_num();
    }
#endif
    return -1;
}

std::string rank_file_name(const std::string& filename, int rank)
{
    if (rank < 0) {
        return filename;
    }
    const std::string suffix = "_rank" + std::to_string(rank);
    const std::size_t dot = filename.rfind('.');
    if (dot == std::string::npos) {
        return filename + suffix;
    }
    return filename.substr(0, dot) + suffix + filename.substr(dot);
}

} // namespace

// ============================================================================
// Levels
// ============================================================================

const char* log_level_to_string(LogLevel level) noexcept
{
    switch (level) {
        case LogLevel::DEBUG:    return "DEBUG";
        case LogLevel::INFO:     return "INFO";
        case LogLevel::WARNING:  return "WARN";
        case LogLevel::ERROR:    return "ERROR";
        case LogLevel::CRITICAL: return "CRIT";
        default:                 return "UNKNOWN";
    }
}

bool parse_log_level(const std::string& name, LogLevel& level)
{
    const std::string key = to_lower(name);
    if (key == "debug") {
        level = LogLevel::DEBUG;
    } else if (key == "info") {
        level = LogLevel::INFO;
    } else if (key == "warning" || key == "warn") {
        level = LogLevel::WARNING;
    } else if (key == "error") {
        level = LogLevel::ERROR;
    } else if (key == "critical" || key == "crit") {
        level = LogLevel::CRITICAL;
    } else if (key == "off") {
        level = LogLevel::OFF;
    } else {
        return false;
    }
    return true;
}

// ============================================================================
// Logger
// ============================================================================

Logger& Logger::instance()
{
    static Logger logger;
    return logger;
}

Logger::~Logger()
{
    if (file_.is_open()) {
        file_.close();
    }
}

void Logger::set_level(LogLevel level)
{
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
}

LogLevel Logger::get_level() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return min_level_;
}

bool Logger::enabled(LogLevel level) const
{
#if !HOMOG_DEBUG_MODE
    if (level == LogLevel::DEBUG) {
        return false;
    }
#endif
    return level != LogLevel::OFF && level >= get_level();
}

void Logger::set_console_output(bool enabled)
{
    std::lock_guard<std::mutex> lock(mutex_);
    console_output_ = enabled;
}

void Logger::set_file_output(const std::string& filename)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.close();
    }
    if (filename.empty()) {
        return;
    }

    const std::string actual = rank_file_name(filename, current_mpi_rank());
    file_.open(actual, std::ios::app);
    if (!file_.is_open()) {
        std::cerr << "[mshc::Homog] cannot open log file '" << actual << "'" << std::endl;
    }
}

void Logger::set_show_rank(bool show)
{
    std::lock_guard<std::mutex> lock(mutex_);
    show_rank_ = show;
}

void Logger::set_show_timestamp(bool show)
{
    std::lock_guard<std::mutex> lock(mutex_);
    show_timestamp_ = show;
}

void Logger::add_handler(LogHandler handler)
{
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_.push_back(std::move(handler));
}

void Logger::clear_handlers()
{
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_.clear();
}

void Logger::log(LogLevel level, const std::string& message, const char* file, int line)
{
    if (!enabled(level)) {
        return;
    }

    LogMessage msg;
    msg.level = level;
    msg.message = message;
    msg.file = file != nullptr ? file : "";
    msg.line = line;
    msg.timestamp = std::chrono::system_clock::now();
    msg.mpi_rank = current_mpi_rank();
    msg.omp_thread = current_omp_thread();

    std::lock_guard<std::mutex> lock(mutex_);
    const std::string text = format(msg);

    if (console_output_) {
        std::ostream& out = (level >= LogLevel::WARNING) ? std::cerr : std::cout;
        out << text << std::flush;
    }
    if (file_.is_open()) {
        file_ << text << std::flush;
    }
    for (const auto& handler : handlers_) {
        handler(msg);
    }
}

std::string Logger::format(const LogMessage& msg) const
{
    std::ostringstream oss;

    if (show_timestamp_) {
        const std::time_t seconds = std::chrono::system_clock::to_time_t(msg.timestamp);
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                            msg.timestamp.time_since_epoch()).count() % 1000;
        std::tm local{};
        localtime_r(&seconds, &local);
        oss << "[" << std::put_time(&local, "%H:%M:%S") << "."
            << std::setfill('0') << std::setw(3) << ms << "] ";
    }
    if (show_rank_ && msg.mpi_rank >= 0) {
        oss << "[R" << msg.mpi_rank << "] ";
    }
    if (msg.omp_thread >= 0) {
        oss << "[T" << msg.omp_thread << "] ";
    }

    oss << "[" << log_level_to_string(msg.level) << "] " << msg.message;

#if HOMOG_DEBUG_MODE
    if (msg.level >= LogLevel::WARNING && !msg.file.empty()) {
        oss << " (" << msg.file << ":" << msg.line << ")";
    }
#endif

    oss << "\n";
    return oss.str();
}

// ============================================================================
// ScopedTimer
// ============================================================================

ScopedTimer::ScopedTimer(std::string name, LogLevel level)
    : name_(std::move(name)), level_(level), start_(std::chrono::steady_clock::now())
{
    Logger::instance().log(level_, "Starting: " + name_);
}

ScopedTimer::~ScopedTimer()
{
    std::ostringstream oss;
    oss << "Completed: " << name_ << " (elapsed: " << std::fixed << std::setprecision(3)
        << elapsedSeconds() << "s)";
    Logger::instance().log(level_, oss.str());
}

double ScopedTimer::elapsedSeconds() const
{
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start_).count();
}

// ============================================================================
// Environment Configuration
// ============================================================================

namespace {

struct EnvironmentConfiguration {
    EnvironmentConfiguration()
    {
        auto& logger = Logger::instance();

        if (const char* level_name = std::getenv("HOMOG_LOG_LEVEL")) {
            LogLevel level = LogLevel::INFO;
            if (parse_log_level(level_name, level)) {
                logger.set_level(level);
            } else {
                std::cerr << "[mshc::Homog] ignoring unknown HOMOG_LOG_LEVEL '"
                          << level_name << "'" << std::endl;
            }
        }
        if (const char* file = std::getenv("HOMOG_LOG_FILE")) {
            logger.set_file_output(file);
        }
        if (const char* console = std::getenv("HOMOG_LOG_CONSOLE")) {
            logger.set_console_output(env_flag_enabled(console));
        }
        if (const char* rank = std::getenv("HOMOG_LOG_SHOW_RANK")) {
            logger.set_show_rank(env_flag_enabled(rank));
        }
        if (const char* show_time = std::getenv("HOMOG_LOG_SHOW_TIME")) {
            logger.set_show_timestamp(env_flag_enabled(show_time));
        }
    }
};

const EnvironmentConfiguration environment_configuration;

} // namespace

} // namespace Homog
} // namespace mshc
