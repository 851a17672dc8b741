/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#include "HomogException.h"

#include <cstdlib>
#include <sstream>
#include <utility>

#if HOMOG_HAS_MPI
#include <mpi.h>
#endif

#if defined(__GNUC__) && !defined(_WIN32)
#include <cxxabi.h>
#include <execinfo.h>
#define HOMOG_HAS_BACKTRACE 1
#else
#define HOMOG_HAS_BACKTRACE 0
#endif

namespace mshc {
namespace Homog {

namespace {

constexpr int MAX_BACKTRACE_FRAMES = 32;
constexpr std::size_t MAX_REPORTED_FRAMES = 10;

#if HOMOG_HAS_BACKTRACE
/**
 * @brief Demangle the symbol of one backtrace_symbols() line in place
 *
 * Lines look like "binary(_ZN4mshc5Homog...+0x1f) [0x...]".
 */
std::string demangleFrame(std::string frame)
{
    const std::size_t open = frame.find('(');
    const std::size_t plus = frame.find('+', open);
    if (open == std::string::npos || plus == std::string::npos || plus == open + 1) {
        return frame;
    }

    const std::string mangled = frame.substr(open + 1, plus - open - 1);
    int status = 0;
    char* demangled = abi::__cxa_demangle(mangled.c_str(), nullptr, nullptr, &status);
    if (status == 0 && demangled != nullptr) {
        frame.replace(open + 1, plus - open - 1, demangled);
    }
    std::free(demangled);
    return frame;
}
#endif

[[maybe_unused]] std::vector<std::string> captureBacktrace()
{
    std::vector<std::string> frames;
#if HOMOG_HAS_BACKTRACE
    void* addresses[MAX_BACKTRACE_FRAMES];
    const int n = ::backtrace(addresses, MAX_BACKTRACE_FRAMES);
    char** symbols = ::backtrace_symbols(addresses, n);
    if (symbols == nullptr) {
        return frames;
    }
    // Frame 0 is this function, frame 1 the exception constructor.
    for (int i = 2; i < n; ++i) {
        frames.push_back(demangleFrame(symbols[i]));
    }
    std::free(symbols);
#endif
    return frames;
}

} // namespace

// ============================================================================
// HomogException
// ============================================================================

HomogException::HomogException(std::string message, HomogStatus status)
    : message_(std::move(message)), status_(status)
{
    record_environment();
    refresh_what();
}

HomogException::HomogException(std::string message,
                               const char* file,
                               int line,
                               const char* function,
                               HomogStatus status)
    : message_(std::move(message)),
      status_(status),
      site_{file != nullptr ? file : "", line, function != nullptr ? function : ""}
{
    record_environment();
    refresh_what();
}

void HomogException::add_context(const std::string& context)
{
    message_ = context + "\n  -> " + message_;
    refresh_what();
}

void HomogException::record_environment()
{
#if HOMOG_HAS_MPI
    int initialized = 0;
    MPI_Initialized(&initialized);
    if (initialized) {
        MPI_Comm_rank(MPI_COMM_WORLD, &mpi_rank_);
    }
#endif

#if HOMOG_DEBUG_MODE
    backtrace_ = captureBacktrace();
#endif
}

void HomogException::refresh_what()
{
    std::ostringstream oss;
    oss << "[mshc::Homog] " << status_to_string(status_) << ": " << message_ << "\n";

    if (site_.known()) {
        oss << "  at " << site_.file << ":" << site_.line;
        if (!site_.function.empty()) {
            oss << " (" << site_.function << ")";
        }
        oss << "\n";
    }
    if (mpi_rank_ >= 0) {
        oss << "  on rank " << mpi_rank_ << "\n";
    }
    if (!backtrace_.empty()) {
        oss << "  backtrace:\n";
        for (std::size_t i = 0; i < backtrace_.size() && i < MAX_REPORTED_FRAMES; ++i) {
            oss << "    #" << i << " " << backtrace_[i] << "\n";
        }
    }

    what_ = oss.str();
}

// ============================================================================
// UnknownIndexPairException
// ============================================================================

namespace {

std::string describePair(const std::string& message, IndexPair pair, StepIndex step)
{
    std::string out = message + " (index pair: " + to_string(pair);
    if (step != NO_STEP) {
        out += ", step: " + std::to_string(step);
    }
    return out + ")";
}

} // namespace

UnknownIndexPairException::UnknownIndexPairException(const std::string& message,
                                                     IndexPair pair,
                                                     StepIndex step,
                                                     const char* file,
                                                     int line,
                                                     const char* function)
    : HomogException(describePair(message, pair, step), file, line, function,
                     HomogStatus::UnknownIndexPair),
      pair_(pair),
      step_(step)
{
}

} // namespace Homog
} // namespace mshc
