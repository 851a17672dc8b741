/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#include "Coefficients/ElasticCoefficients.h"

namespace mshc {
namespace Homog {
namespace coefs {

using problem::Substitution;
using problem::SubstitutionList;

namespace {

FieldVector perturbedState(const std::string& coef,
                           const std::string& variable,
                           const FieldVector& pi,
                           const FieldVector& corrector)
{
    HOMOG_THROW_IF(pi.size() != corrector.size(), InvalidArgumentException,
                   "'" + coef + "': base field of '" + variable + "' has " +
                   std::to_string(pi.size()) + " entries, corrector block has " +
                   std::to_string(corrector.size()));
    return pi + corrector;
}

} // namespace

CoefficientEvaluator makeElasticCoef(const std::string& name,
                                     std::vector<std::string> variables,
                                     const std::string& pis,
                                     const std::string& correctors,
                                     const std::string& expression)
{
    EvaluatorDefinition def;
    def.name = name;
    def.kind = CoefficientClass::SymSym;
    def.requirements = {pis, correctors};
    def.variables = std::move(variables);
    def.expression = expression;
    def.substitute = [pis, correctors](const CoefficientEvaluator& self,
                                       const EvaluationRequest& req) {
        const std::string& var = self.variableForMode(req.mode);
        const std::string& primary = req.problem.primaryVariableName(var);

        const auto& pi = req.data.perturbation(pis).value(req.pair);
        const auto block = req.data.corrector(correctors).extract(req.pair, primary);

        SubstitutionList subs;
        subs.emplace_back(var, perturbedState(self.name(), var, pi, block));
        return subs;
    };
    return CoefficientEvaluator(std::move(def));
}

CoefficientEvaluator makeElasticBiotCoef(const std::string& name,
                                         std::vector<std::string> variables,
                                         const std::string& correctors,
                                         const std::string& expression)
{
    EvaluatorDefinition def;
    def.name = name;
    def.kind = CoefficientClass::Sym;
    def.requirements = {correctors};
    def.variables = std::move(variables);
    def.expression = expression;
    def.substitute = [correctors](const CoefficientEvaluator& self,
                                  const EvaluationRequest& req) {
        SubstitutionList subs;
        if (req.mode == EvaluationMode::Col) {
            const std::string& var = self.variables()[0];
            const auto n_nod = req.problem.variable(var).n_nod;
            subs.emplace_back(var, FieldVector::Ones(static_cast<Eigen::Index>(n_nod)));
        } else {
            const std::string& var = self.variables()[1];
            const std::string& primary = req.problem.primaryVariableName(var);
            subs.emplace_back(var, req.data.corrector(correctors).extract(req.pair, primary));
        }
        return subs;
    };
    return CoefficientEvaluator(std::move(def));
}

CoefficientEvaluator makeCorrectorsElasticRhs(const std::string& name,
                                              std::vector<std::string> variables,
                                              const std::string& pis,
                                              const std::string& expression)
{
    EvaluatorDefinition def;
    def.name = name;
    def.kind = CoefficientClass::DimDim;
    def.requirements = {pis};
    def.variables = std::move(variables);
    def.expression = expression;
    def.substitute = [pis](const CoefficientEvaluator& self, const EvaluationRequest& req) {
        SubstitutionList subs;
        subs.emplace_back(self.variables().back(), req.data.perturbation(pis).value(req.pair));
        return subs;
    };
    return CoefficientEvaluator(std::move(def));
}

CoefficientEvaluator makeElasticCoefTimeSeries(const std::string& name,
                                               std::vector<std::string> variables,
                                               const std::string& pis,
                                               const std::string& correctors,
                                               const std::string& expression)
{
    EvaluatorDefinition def;
    def.name = name;
    def.kind = CoefficientClass::TimeSeries;
    def.requirements = {pis, correctors};
    def.variables = std::move(variables);
    def.expression = expression;
    def.time_source = correctors;
    def.substitute = [pis, correctors](const CoefficientEvaluator& self,
                                       const EvaluationRequest& req) {
        const std::string& var = self.variableForMode(req.mode);
        const std::string& primary = req.problem.primaryVariableName(var);

        const auto& pi = req.data.perturbation(pis).value(req.pair);
        const auto block = req.data.corrector(correctors).extract(req.pair, req.step, primary);

        SubstitutionList subs;
        subs.emplace_back(var, perturbedState(self.name(), var, pi, block));
        return subs;
    };
    return CoefficientEvaluator(std::move(def));
}

} // namespace coefs
} // namespace Homog
} // namespace mshc
