/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#include "Assembly/TensorAssembler.h"

#include "Core/Logger.h"
#include "Core/SymmetricIndexing.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <exception>
#include <memory>
#include <mutex>
#include <vector>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace mshc {
namespace Homog {
namespace assembly {

using coefs::CoefficientEvaluator;
using coefs::EvaluationMode;
using dependencies::CoefficientResult;
using dependencies::DependencyMap;

// ============================================================================
// Construction
// ============================================================================

TensorAssembler::TensorAssembler(const problem::ProblemContext& problem,
                                 AssemblyOptions options)
    : problem_(problem)
{
    setOptions(options);
}

void TensorAssembler::setOptions(const AssemblyOptions& options)
{
    HOMOG_THROW_IF(!(options.volume > 0.0), InvalidArgumentException,
                   "TensorAssembler: cell volume must be positive, got " +
                   std::to_string(options.volume));
    HOMOG_THROW_IF(options.num_threads < 1, InvalidArgumentException,
                   "TensorAssembler: num_threads must be at least 1");
    HOMOG_THROW_IF(options.symmetry_tolerance < 0.0, InvalidArgumentException,
                   "TensorAssembler: negative symmetry tolerance");
    options_ = options;
}

// ============================================================================
// Assembly
// ============================================================================

CoefficientResult TensorAssembler::assemble(const CoefficientEvaluator& coef,
                                            const DependencyMap& data)
{
    const auto start_time = std::chrono::steady_clock::now();
    const int dim = problem_.dimension();
    symmetry::checkDimension(dim);

    // Fail before any integration if a dependency is missing.
    data.checkContains(coef.requirements());

    stats_ = AssemblyStatistics{};
    std::vector<DenseTensor> steps;

    switch (coef.coefficientClass()) {
        case CoefficientClass::SymSym:
            steps.push_back(assembleSymSym(coef, data, NO_STEP));
            break;
        case CoefficientClass::Sym:
            steps.push_back(assembleSym(coef, data));
            break;
        case CoefficientClass::DimDim:
            steps.push_back(assembleDimDim(coef, data));
            break;
        case CoefficientClass::TimeSeries: {
            const auto& corrs = data.corrector(coef.timeSource());
            HOMOG_THROW_IF(!corrs.isTimeDependent(), InvalidArgumentException,
                           "TensorAssembler: time series '" + coef.name() +
                           "' needs a time-dependent corrector, '" + corrs.name() +
                           "' is static");
            for (StepIndex step = 0; step < corrs.numTimeSteps(); ++step) {
                steps.push_back(assembleSymSym(coef, data, step));
            }
            break;
        }
    }

    for (auto& t : steps) {
        t /= options_.volume;
    }

    const auto end_time = std::chrono::steady_clock::now();
    stats_.steps = static_cast<int>(steps.size());
    stats_.elapsed_time_seconds = std::chrono::duration<double>(end_time - start_time).count();

    HOMOG_LOG_INFO("TensorAssembler: '" + coef.name() + "' (" +
                   coefficient_class_to_string(coef.coefficientClass()) + ", dim " +
                   std::to_string(dim) + "): " + std::to_string(stats_.entries_evaluated) +
                   " entries, " + std::to_string(stats_.integrals_evaluated) +
                   " integrals in " + std::to_string(stats_.elapsed_time_seconds) + " s");

    return CoefficientResult(coef.name(), coef.coefficientClass(), dim, std::move(steps));
}

DenseTensor TensorAssembler::assembleSymSym(const CoefficientEvaluator& coef,
                                            const DependencyMap& data,
                                            StepIndex step)
{
    const int dim = problem_.dimension();
    const int sym = symmetry::symSize(dim);

    // Independent entries (I, J); with verify_symmetry both triangles are computed.
    std::vector<IndexPair> entries;
    for (int I = 0; I < sym; ++I) {
        for (int J = options_.verify_symmetry ? 0 : I; J < sym; ++J) {
            entries.emplace_back(I, J);
        }
    }

    DenseTensor tensor = DenseTensor::Zero(sym, sym);
    forEachEntry(entries.size(), [&](std::size_t k) {
        const IndexPair e = entries[k];
        auto subs = substitutions(coef, data, symmetry::symPair(dim, e.ir), step,
                                  EvaluationMode::Row);
        auto col = substitutions(coef, data, symmetry::symPair(dim, e.ic), step,
                                 EvaluationMode::Col);
        subs.insert(subs.end(), std::make_move_iterator(col.begin()),
                    std::make_move_iterator(col.end()));

        const Real value = integrate(coef, subs);
        tensor(e.ir, e.ic) = value;
        if (!options_.verify_symmetry) {
            tensor(e.ic, e.ir) = value;
        }
        HOMOG_LOG_DEBUG("TensorAssembler: '" + coef.name() + "' entry " + to_string(e) +
                        (step == NO_STEP ? std::string() : " step " + std::to_string(step)) +
                        " = " + std::to_string(value));
    });

    stats_.entries_evaluated += static_cast<GlobalIndex>(entries.size());
    stats_.integrals_evaluated += static_cast<GlobalIndex>(entries.size());

    if (options_.verify_symmetry) {
        checkSymmetry(coef, tensor, step);
    }
    return tensor;
}

DenseTensor TensorAssembler::assembleSym(const CoefficientEvaluator& coef,
                                         const DependencyMap& data)
{
    const int dim = problem_.dimension();
    const int sym = symmetry::symSize(dim);

    DenseTensor tensor = DenseTensor::Zero(sym, 1);
    forEachEntry(static_cast<std::size_t>(sym), [&](std::size_t k) {
        const auto I = static_cast<TensorIndex>(k);
        const IndexPair pair = symmetry::symPair(dim, I);

        auto subs = substitutions(coef, data, pair, NO_STEP, EvaluationMode::Col);
        auto row = substitutions(coef, data, pair, NO_STEP, EvaluationMode::Row);
        subs.insert(subs.end(), std::make_move_iterator(row.begin()),
                    std::make_move_iterator(row.end()));

        tensor(I, 0) = integrate(coef, subs);
    });

    stats_.entries_evaluated += sym;
    stats_.integrals_evaluated += sym;
    return tensor;
}

DenseTensor TensorAssembler::assembleDimDim(const CoefficientEvaluator& coef,
                                            const DependencyMap& data)
{
    const int dim = problem_.dimension();
    const auto pairs = symmetry::iterDimDim(dim);

    DenseTensor tensor = DenseTensor::Zero(dim, dim);
    forEachEntry(pairs.size(), [&](std::size_t k) {
        const IndexPair pair = pairs[k];
        const auto subs = substitutions(coef, data, pair, NO_STEP, EvaluationMode::All);
        tensor(pair.ir, pair.ic) = integrate(coef, subs);
    });

    stats_.entries_evaluated += static_cast<GlobalIndex>(pairs.size());
    stats_.integrals_evaluated += static_cast<GlobalIndex>(pairs.size());
    return tensor;
}

// ============================================================================
// Helpers
// ============================================================================

problem::SubstitutionList TensorAssembler::substitutions(const CoefficientEvaluator& coef,
                                                         const DependencyMap& data,
                                                         IndexPair pair, StepIndex step,
                                                         EvaluationMode mode) const
{
    if (step == NO_STEP) {
        return coef.getVariables(problem_, pair.ir, pair.ic, data, mode);
    }
    return coef.getVariablesAt(problem_, pair.ir, pair.ic, step, data, mode);
}

Real TensorAssembler::integrate(const CoefficientEvaluator& coef,
                                const problem::SubstitutionList& subs) const
{
    return problem_.evaluateIntegral(coef.expression(), subs);
}

void TensorAssembler::forEachEntry(std::size_t n,
                                   const std::function<void(std::size_t)>& task) const
{
    const int num_threads = options_.num_threads;
    const bool use_parallel = (num_threads > 1) && (n > 1);

    if (!use_parallel) {
        for (std::size_t k = 0; k < n; ++k) {
            task(k);
        }
        return;
    }

#ifdef _OPENMP
    std::exception_ptr first_error;
    std::mutex error_mutex;
    std::atomic<bool> failed{false};
    const auto count = static_cast<std::int64_t>(n);

    #pragma omp parallel for num_threads(num_threads) schedule(static)
    for (std::int64_t k = 0; k < count; ++k) {
        if (failed.load(std::memory_order_relaxed)) {
            continue;
        }
        try {
            task(static_cast<std::size_t>(k));
        } catch (...) {
            std::lock_guard<std::mutex> lock(error_mutex);
            if (!first_error) {
                first_error = std::current_exception();
            }
            failed.store(true, std::memory_order_relaxed);
        }
    }

    if (first_error) {
        std::rethrow_exception(first_error);
    }
#else
    HOMOG_LOG_DEBUG("TensorAssembler: built without OpenMP, evaluating " +
                    std::to_string(n) + " entries sequentially");
    for (std::size_t k = 0; k < n; ++k) {
        task(k);
    }
#endif
}

void TensorAssembler::checkSymmetry(const CoefficientEvaluator& coef, DenseTensor& tensor,
                                    StepIndex step) const
{
    const auto n = tensor.rows();
    for (Eigen::Index I = 0; I < n; ++I) {
        for (Eigen::Index J = I + 1; J < n; ++J) {
            const Real upper = tensor(I, J);
            const Real lower = tensor(J, I);
            const Real scale = std::max({Real(1), std::abs(upper), std::abs(lower)});
            if (std::abs(upper - lower) > options_.symmetry_tolerance * scale) {
                std::string msg = "TensorAssembler: '" + coef.name() + "' is not symmetric: (" +
                                  std::to_string(I) + ", " + std::to_string(J) + ") = " +
                                  std::to_string(upper) + ", (" + std::to_string(J) + ", " +
                                  std::to_string(I) + ") = " + std::to_string(lower);
                if (step != NO_STEP) {
                    msg += " at step " + std::to_string(step);
                }
                throw HomogException(msg, __FILE__, __LINE__, __FUNCTION__,
                                     HomogStatus::AssemblyError);
            }
            tensor(J, I) = upper;
        }
    }
}

// ============================================================================
// Resolver Integration
// ============================================================================

dependencies::RequirementResolver::Producer
makeCoefficientProducer(const problem::ProblemContext& problem,
                        CoefficientEvaluator coef,
                        AssemblyOptions options)
{
    auto shared_coef = std::make_shared<const CoefficientEvaluator>(std::move(coef));
    return [&problem, shared_coef, options](const DependencyMap& requirements) {
        TensorAssembler assembler(problem, options);
        auto result = assembler.assemble(*shared_coef, requirements);
        return dependencies::DependencyValue{
            std::make_shared<const CoefficientResult>(std::move(result))};
    };
}

void registerCoefficient(dependencies::RequirementResolver& resolver,
                         const problem::ProblemContext& problem,
                         CoefficientEvaluator coef,
                         AssemblyOptions options)
{
    const std::string name = coef.name();
    auto requirements = coef.requirements();
    resolver.addProducer(name, std::move(requirements),
                         makeCoefficientProducer(problem, std::move(coef), options));
}

} // namespace assembly
} // namespace Homog
} // namespace mshc
