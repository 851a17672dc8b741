/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#ifndef MSHC_HOMOG_EXCEPTION_H
#define MSHC_HOMOG_EXCEPTION_H

/**
 * @file HomogException.h
 * @brief Exception hierarchy for the homogenization library
 *
 * Every error raised while evaluating a homogenized coefficient is a
 * programmer or configuration error: a dependency that was declared but not
 * resolved, an index pair outside a corrector's range, or a variable name the
 * problem context cannot map. None of them is retried; they abort the
 * enclosing tensor computation.
 *
 * what() reads
 *
 *   [mshc::Homog] Missing dependency: <message>
 *     at Coefficients/CoefficientEvaluator.cpp:97 (evaluate)
 *     on rank 2
 *     backtrace: ...                       (debug builds)
 */

#include "Types.h"
#include "HomogConfig.h"

#include <exception>
#include <string>
#include <vector>

namespace mshc {
namespace Homog {

/**
 * @brief Source location recorded by the throwing macros
 */
struct ThrowSite {
    std::string file;
    int line{0};
    std::string function;

    [[nodiscard]] bool known() const noexcept { return !file.empty(); }
};

// ============================================================================
// Base Exception Class
// ============================================================================

class HomogException : public std::exception {
public:
    explicit HomogException(std::string message,
                            HomogStatus status = HomogStatus::Unknown);

    HomogException(std::string message,
                   const char* file,
                   int line,
                   const char* function = "",
                   HomogStatus status = HomogStatus::Unknown);

    ~HomogException() noexcept override = default;

    const char* what() const noexcept override { return what_.c_str(); }

    HomogStatus status() const noexcept { return status_; }

    /**
     * @brief Message including any added context, without location decoration
     */
    const std::string& message() const noexcept { return message_; }

    const ThrowSite& site() const noexcept { return site_; }
    const std::string& file() const noexcept { return site_.file; }
    int line() const noexcept { return site_.line; }

    /**
     * @brief MPI rank of the throwing process, -1 outside MPI runs
     */
    int mpi_rank() const noexcept { return mpi_rank_; }

    const std::vector<std::string>& backtrace() const noexcept { return backtrace_; }

    /**
     * @brief Prefix the message with what the caller was doing
     *
     * Used while unwinding through the dependency resolver so that the
     * message names the coefficient whose computation failed.
     */
    void add_context(const std::string& context);

private:
    void record_environment();
    void refresh_what();

    std::string message_;
    HomogStatus status_;
    ThrowSite site_;
    int mpi_rank_{-1};
    std::vector<std::string> backtrace_;
    std::string what_;
};

// ============================================================================
// Specific Exception Types
// ============================================================================

class InvalidArgumentException : public HomogException {
public:
    InvalidArgumentException(const std::string& message,
                             const char* file = "",
                             int line = 0,
                             const char* function = "")
        : HomogException(message, file, line, function, HomogStatus::InvalidArgument) {}
};

/**
 * @brief A declared dependency is absent from the resolved data (or has the wrong kind)
 */
class MissingDependencyException : public HomogException {
public:
    MissingDependencyException(const std::string& dependency,
                               const std::string& message,
                               const char* file = "",
                               int line = 0,
                               const char* function = "")
        : HomogException(message + " (dependency: '" + dependency + "')",
                         file, line, function, HomogStatus::MissingDependency),
          dependency_(dependency) {}

    const std::string& dependency() const noexcept { return dependency_; }

private:
    std::string dependency_;
};

/**
 * @brief A corrector or perturbation field was queried outside its declared range
 */
class UnknownIndexPairException : public HomogException {
public:
    UnknownIndexPairException(const std::string& message,
                              IndexPair pair,
                              StepIndex step = NO_STEP,
                              const char* file = "",
                              int line = 0,
                              const char* function = "");

    IndexPair pair() const noexcept { return pair_; }
    StepIndex step() const noexcept { return step_; }

private:
    IndexPair pair_;
    StepIndex step_;
};

/**
 * @brief A variable name cannot be mapped to a primary variable or layout field
 */
class VariableLookupException : public HomogException {
public:
    VariableLookupException(const std::string& variable,
                            const std::string& message,
                            const char* file = "",
                            int line = 0,
                            const char* function = "")
        : HomogException(message + " (variable: '" + variable + "')",
                         file, line, function, HomogStatus::VariableLookup),
          variable_(variable) {}

    const std::string& variable() const noexcept { return variable_; }

private:
    std::string variable_;
};

// ============================================================================
// Exception Throwing Macros
// ============================================================================

/**
 * @brief Throw with the current source location
 *
 * Exceptions that name a subject (dependency, variable) take it before the
 * message: HOMOG_THROW_WITH(MissingDependencyException, name, msg).
 */
#define HOMOG_THROW(ExceptionType, message) \
    throw ExceptionType(message, __FILE__, __LINE__, __FUNCTION__)

#define HOMOG_THROW_WITH(ExceptionType, subject, message) \
    throw ExceptionType(subject, message, __FILE__, __LINE__, __FUNCTION__)

#define HOMOG_THROW_IF_3(condition, ExceptionType, message) \
    do { \
        if (HOMOG_UNLIKELY(condition)) { \
            HOMOG_THROW(ExceptionType, message); \
        } \
    } while (0)

#define HOMOG_THROW_IF_2(condition, message) \
    HOMOG_THROW_IF_3(condition, mshc::Homog::HomogException, message)

#define HOMOG_THROW_IF_SELECT(_1, _2, _3, NAME, ...) NAME

/**
 * @brief (condition, message) or (condition, ExceptionType, message)
 */
#define HOMOG_THROW_IF(...) \
    HOMOG_THROW_IF_SELECT(__VA_ARGS__, HOMOG_THROW_IF_3, HOMOG_THROW_IF_2)(__VA_ARGS__)

#define HOMOG_CHECK_ARG(condition, message) \
    HOMOG_THROW_IF(!(condition), InvalidArgumentException, message)

} // namespace Homog
} // namespace mshc

#endif // MSHC_HOMOG_EXCEPTION_H
