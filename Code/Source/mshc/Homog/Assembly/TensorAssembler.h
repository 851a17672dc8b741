/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#ifndef MSHC_HOMOG_ASSEMBLY_TENSORASSEMBLER_H
#define MSHC_HOMOG_ASSEMBLY_TENSORASSEMBLER_H

/**
 * @file TensorAssembler.h
 * @brief Builds homogenized tensors entry by entry
 *
 * The assembler enumerates the independent entries of a coefficient's
 * symmetry class, asks the evaluator for the substitutions of each entry,
 * integrates them through the problem context and scatters the value into
 * every symmetric image:
 *
 *   SymSym      (I, J), I <= J, of the sym x sym matrix; row at symPair(I),
 *               col at symPair(J); stored at (I, J) and (J, I)
 *   Sym         entry I of a sym vector; col then row at symPair(I)
 *   DimDim      every (ir, ic) of the dim x dim matrix, mode All
 *   TimeSeries  the SymSym procedure for every corrector step
 *
 * Entries are independent. With OpenMP and num_threads > 1 they are
 * evaluated in parallel; the first exception raised by any entry is
 * rethrown after the parallel region and no tensor is returned.
 */

#include "Core/Types.h"
#include "Core/HomogConfig.h"
#include "Coefficients/CoefficientEvaluator.h"
#include "Dependencies/CoefficientResult.h"
#include "Dependencies/DependencyMap.h"
#include "Dependencies/RequirementResolver.h"
#include "Problem/ProblemContext.h"

#include <cstddef>
#include <functional>

namespace mshc {
namespace Homog {
namespace assembly {

/**
 * @brief Tensor assembly options
 */
struct AssemblyOptions {
    Real volume{1.0};                    ///< Unit-cell volume; entries are divided by it
    int num_threads{1};                  ///< Threads for entry evaluation (1 = sequential)

    // Debugging
    bool verify_symmetry{false};         ///< Evaluate both halves of SymSym tensors and compare
    Real symmetry_tolerance{config::DEFAULT_SYMMETRY_TOLERANCE};
};

/**
 * @brief Statistics of the last assemble() call
 */
struct AssemblyStatistics {
    GlobalIndex entries_evaluated{0};
    GlobalIndex integrals_evaluated{0};
    int steps{0};
    double elapsed_time_seconds{0.0};
};

class TensorAssembler {
public:
    /**
     * @param problem Context used for every integral; must outlive the assembler
     */
    explicit TensorAssembler(const problem::ProblemContext& problem,
                             AssemblyOptions options = {});

    void setOptions(const AssemblyOptions& options);
    [[nodiscard]] const AssemblyOptions& options() const noexcept { return options_; }
    [[nodiscard]] const AssemblyStatistics& lastStatistics() const noexcept { return stats_; }

    /**
     * @brief Compute the full tensor of @p coef
     *
     * @param data Resolved dependencies; must contain coef.requirements()
     * @throws MissingDependencyException, UnknownIndexPairException,
     *         VariableLookupException from the evaluator; HomogException with
     *         AssemblyError status when verify_symmetry detects an asymmetric
     *         tensor
     */
    [[nodiscard]] dependencies::CoefficientResult assemble(const coefs::CoefficientEvaluator& coef,
                                                           const dependencies::DependencyMap& data);

private:
    DenseTensor assembleSymSym(const coefs::CoefficientEvaluator& coef,
                               const dependencies::DependencyMap& data,
                               StepIndex step);
    DenseTensor assembleSym(const coefs::CoefficientEvaluator& coef,
                            const dependencies::DependencyMap& data);
    DenseTensor assembleDimDim(const coefs::CoefficientEvaluator& coef,
                               const dependencies::DependencyMap& data);

    problem::SubstitutionList substitutions(const coefs::CoefficientEvaluator& coef,
                                            const dependencies::DependencyMap& data,
                                            IndexPair pair, StepIndex step,
                                            coefs::EvaluationMode mode) const;

    Real integrate(const coefs::CoefficientEvaluator& coef,
                   const problem::SubstitutionList& subs) const;

    /**
     * @brief Run task(0..n-1), in parallel when configured
     */
    void forEachEntry(std::size_t n, const std::function<void(std::size_t)>& task) const;

    void checkSymmetry(const coefs::CoefficientEvaluator& coef, DenseTensor& tensor,
                       StepIndex step) const;

    const problem::ProblemContext& problem_;
    AssemblyOptions options_;
    AssemblyStatistics stats_;
};

/**
 * @brief Resolver producer that assembles @p coef from its requirements
 *
 * The problem context is captured by reference and must outlive the resolver.
 */
[[nodiscard]] dependencies::RequirementResolver::Producer
makeCoefficientProducer(const problem::ProblemContext& problem,
                        coefs::CoefficientEvaluator coef,
                        AssemblyOptions options = {});

/**
 * @brief Register @p coef with the resolver under its own name and requirements
 */
void registerCoefficient(dependencies::RequirementResolver& resolver,
                         const problem::ProblemContext& problem,
                         coefs::CoefficientEvaluator coef,
                         AssemblyOptions options = {});

} // namespace assembly
} // namespace Homog
} // namespace mshc

#endif // MSHC_HOMOG_ASSEMBLY_TENSORASSEMBLER_H
