/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#include "Coefficients/CoefficientEvaluator.h"

#include <algorithm>

namespace mshc {
namespace Homog {
namespace coefs {

EvaluationMode parseEvaluationMode(std::string_view mode)
{
    if (mode == "row") {
        return EvaluationMode::Row;
    }
    if (mode == "col") {
        return EvaluationMode::Col;
    }
    HOMOG_THROW_WITH(VariableLookupException, std::string(mode),
                     "parseEvaluationMode: evaluation mode must be 'row' or 'col'");
}

// =============================================================================
// Construction
// =============================================================================

CoefficientEvaluator::CoefficientEvaluator(EvaluatorDefinition definition)
    : def_(std::move(definition))
{
    HOMOG_THROW_IF(def_.name.empty(), InvalidArgumentException,
                   "CoefficientEvaluator: empty coefficient name");
    HOMOG_THROW_IF(def_.variables.empty(), InvalidArgumentException,
                   "CoefficientEvaluator '" + def_.name + "': no variables declared");
    HOMOG_THROW_IF(!def_.substitute, InvalidArgumentException,
                   "CoefficientEvaluator '" + def_.name + "': no substitution function");
    HOMOG_THROW_IF(splitsModes() && def_.variables.size() < 2, InvalidArgumentException,
                   "CoefficientEvaluator '" + def_.name +
                   "': row/col coefficients need two variables");

    for (auto it = def_.requirements.begin(); it != def_.requirements.end(); ++it) {
        HOMOG_THROW_IF(std::find(def_.requirements.begin(), it, *it) != it,
                       InvalidArgumentException,
                       "CoefficientEvaluator '" + def_.name + "': requirement '" + *it +
                       "' listed twice");
    }

    if (def_.kind == CoefficientClass::TimeSeries) {
        const bool listed = std::find(def_.requirements.begin(), def_.requirements.end(),
                                      def_.time_source) != def_.requirements.end();
        HOMOG_THROW_IF(!listed, InvalidArgumentException,
                       "CoefficientEvaluator '" + def_.name +
                       "': time series needs its step corrector among the requirements");
    }
}

bool CoefficientEvaluator::splitsModes() const noexcept
{
    return def_.kind != CoefficientClass::DimDim;
}

// =============================================================================
// Substitutions
// =============================================================================

problem::SubstitutionList CoefficientEvaluator::getVariables(const problem::ProblemContext& problem,
                                                             TensorIndex ir, TensorIndex ic,
                                                             const dependencies::DependencyMap& data,
                                                             EvaluationMode mode) const
{
    HOMOG_THROW_IF(def_.kind == CoefficientClass::TimeSeries, InvalidArgumentException,
                   "CoefficientEvaluator '" + def_.name + "': time series needs a step");
    return evaluate(EvaluationRequest{problem, IndexPair{ir, ic}, NO_STEP, data, mode});
}

problem::SubstitutionList CoefficientEvaluator::getVariablesAt(const problem::ProblemContext& problem,
                                                               TensorIndex ir, TensorIndex ic,
                                                               StepIndex step,
                                                               const dependencies::DependencyMap& data,
                                                               EvaluationMode mode) const
{
    HOMOG_THROW_IF(def_.kind != CoefficientClass::TimeSeries, InvalidArgumentException,
                   "CoefficientEvaluator '" + def_.name + "': static coefficient has no steps");
    return evaluate(EvaluationRequest{problem, IndexPair{ir, ic}, step, data, mode});
}

problem::SubstitutionList CoefficientEvaluator::evaluate(const EvaluationRequest& request) const
{
    request.data.checkContains(def_.requirements);

    if (splitsModes() && request.mode == EvaluationMode::All) {
        HOMOG_THROW_WITH(VariableLookupException, evaluation_mode_to_string(request.mode),
                         "CoefficientEvaluator '" + def_.name +
                         "': evaluation mode must be 'row' or 'col'");
    }

    auto subs = def_.substitute(*this, request);

    HOMOG_THROW_IF(subs.size() > def_.variables.size(), HomogException,
                   "CoefficientEvaluator '" + def_.name + "': produced " +
                   std::to_string(subs.size()) + " substitutions for " +
                   std::to_string(def_.variables.size()) + " variables");
    return subs;
}

const std::string& CoefficientEvaluator::variableForMode(EvaluationMode mode) const
{
    HOMOG_THROW_IF(def_.variables.size() < 2, InvalidArgumentException,
                   "CoefficientEvaluator '" + def_.name + "': no row/col variable pair");
    switch (mode) {
        case EvaluationMode::Row:
            return def_.variables[0];
        case EvaluationMode::Col:
            return def_.variables[1];
        default:
            HOMOG_THROW_WITH(VariableLookupException, evaluation_mode_to_string(mode),
                             "CoefficientEvaluator '" + def_.name +
                             "': evaluation mode must be 'row' or 'col'");
    }
}

} // namespace coefs
} // namespace Homog
} // namespace mshc
