/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#ifndef MSHC_HOMOG_COEFFICIENTS_COEFFICIENTEVALUATOR_H
#define MSHC_HOMOG_COEFFICIENTS_COEFFICIENTEVALUATOR_H

/**
 * @file CoefficientEvaluator.h
 * @brief Per-entry substitution source of a homogenized coefficient
 *
 * An evaluator describes one coefficient: the dependencies it reads, the
 * weak-form variables it substitutes, the integral expression and the
 * coefficient class that fixes which index pairs and modes the assembler
 * requests. For a single (ir, ic) [and step] it returns the substitutions
 * that turn the expression into one tensor entry.
 *
 * Evaluators are values: the class decides the index iteration, and the
 * substitution function supplied by a factory (see ElasticCoefficients.h)
 * decides the fields. getVariables() is const and may be called from
 * several threads at once.
 */

#include "Core/Types.h"
#include "Core/HomogException.h"
#include "Coefficients/EvaluationMode.h"
#include "Dependencies/DependencyMap.h"
#include "Problem/ProblemContext.h"

#include <functional>
#include <string>
#include <vector>

namespace mshc {
namespace Homog {
namespace coefs {

class CoefficientEvaluator;

/**
 * @brief Arguments of one substitution request
 */
struct EvaluationRequest {
    const problem::ProblemContext& problem;
    IndexPair pair;
    StepIndex step;
    const dependencies::DependencyMap& data;
    EvaluationMode mode;
};

using SubstitutionFunction =
    std::function<problem::SubstitutionList(const CoefficientEvaluator& self,
                                             const EvaluationRequest& request)>;

struct EvaluatorDefinition {
    std::string name;
    CoefficientClass kind{CoefficientClass::SymSym};
    std::vector<std::string> requirements;
    std::vector<std::string> variables;
    std::string expression;
    std::string time_source;            // TimeSeries: corrector providing the steps
    SubstitutionFunction substitute;
};

class CoefficientEvaluator {
public:
    explicit CoefficientEvaluator(EvaluatorDefinition definition);

    [[nodiscard]] const std::string& name() const noexcept { return def_.name; }
    [[nodiscard]] CoefficientClass coefficientClass() const noexcept { return def_.kind; }
    [[nodiscard]] const std::vector<std::string>& requirements() const noexcept { return def_.requirements; }
    [[nodiscard]] const std::vector<std::string>& variables() const noexcept { return def_.variables; }
    [[nodiscard]] const std::string& expression() const noexcept { return def_.expression; }
    [[nodiscard]] const std::string& timeSource() const noexcept { return def_.time_source; }

    /**
     * @brief True for classes evaluated in separate row and col halves
     */
    [[nodiscard]] bool splitsModes() const noexcept;

    /**
     * @brief Substitutions for entry (ir, ic) of a static coefficient
     *
     * @throws MissingDependencyException if @p data lacks a required name;
     *         nothing else is looked up in that case
     * @throws VariableLookupException for EvaluationMode::All on a split class
     */
    [[nodiscard]] problem::SubstitutionList getVariables(const problem::ProblemContext& problem,
                                                         TensorIndex ir, TensorIndex ic,
                                                         const dependencies::DependencyMap& data,
                                                         EvaluationMode mode) const;

    /**
     * @brief Substitutions for entry (ir, ic) at time step @p step
     *
     * Only valid for TimeSeries evaluators.
     */
    [[nodiscard]] problem::SubstitutionList getVariablesAt(const problem::ProblemContext& problem,
                                                           TensorIndex ir, TensorIndex ic,
                                                           StepIndex step,
                                                           const dependencies::DependencyMap& data,
                                                           EvaluationMode mode) const;

    /**
     * @brief Variable a split class substitutes in @p mode (variables[0] or [1])
     */
    [[nodiscard]] const std::string& variableForMode(EvaluationMode mode) const;

private:
    problem::SubstitutionList evaluate(const EvaluationRequest& request) const;

    EvaluatorDefinition def_;
};

} // namespace coefs
} // namespace Homog
} // namespace mshc

#endif // MSHC_HOMOG_COEFFICIENTS_COEFFICIENTEVALUATOR_H
