/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#include "Problem/DiscreteFormProblem.h"

#include "Core/SymmetricIndexing.h"

namespace mshc {
namespace Homog {
namespace problem {

DiscreteFormProblem::DiscreteFormProblem(int dim, VariableRegistry variables)
    : dim_(dim), variables_(std::move(variables))
{
    symmetry::checkDimension(dim);
}

void DiscreteFormProblem::checkUnusedName(const std::string& expression) const
{
    HOMOG_THROW_IF(expression.empty(), InvalidArgumentException,
                   "DiscreteFormProblem: empty expression name");
    HOMOG_THROW_IF(forms_.count(expression) > 0, InvalidArgumentException,
                   "DiscreteFormProblem: expression '" + expression + "' already registered");
}

void DiscreteFormProblem::addBilinearForm(const std::string& expression,
                                          const std::string& test_var,
                                          const std::string& trial_var,
                                          SparseMatrix matrix)
{
    checkUnusedName(expression);
    const auto& test = variables_.get(test_var);
    const auto& trial = variables_.get(trial_var);

    HOMOG_THROW_IF(matrix.rows() != test.numDofs() || matrix.cols() != trial.numDofs(),
                   InvalidArgumentException,
                   "DiscreteFormProblem::addBilinearForm: matrix of '" + expression +
                   "' is " + std::to_string(matrix.rows()) + "x" + std::to_string(matrix.cols()) +
                   ", expected " + std::to_string(test.numDofs()) + "x" +
                   std::to_string(trial.numDofs()));

    Form form;
    form.test_var = test_var;
    form.trial_var = trial_var;
    form.matrix = std::move(matrix);
    form.matrix.makeCompressed();
    forms_.emplace(expression, std::move(form));
}

void DiscreteFormProblem::addLinearForm(const std::string& expression,
                                        const std::string& test_var,
                                        FieldVector vector)
{
    checkUnusedName(expression);
    const auto& test = variables_.get(test_var);

    HOMOG_THROW_IF(vector.size() != test.numDofs(), InvalidArgumentException,
                   "DiscreteFormProblem::addLinearForm: vector of '" + expression +
                   "' has " + std::to_string(vector.size()) + " entries, expected " +
                   std::to_string(test.numDofs()));

    Form form;
    form.test_var = test_var;
    form.vector = std::move(vector);
    forms_.emplace(expression, std::move(form));
}

bool DiscreteFormProblem::hasExpression(std::string_view expression) const noexcept
{
    return forms_.count(std::string(expression)) > 0;
}

const VariableInfo& DiscreteFormProblem::variable(std::string_view name) const
{
    return variables_.get(name);
}

const Eigen::MatrixXd& DiscreteFormProblem::nodeCoordinates(std::string_view name) const
{
    return variables_.coordinates(name);
}

const FieldVector& DiscreteFormProblem::substitutedValue(const std::string& expression,
                                                         const std::string& var,
                                                         const SubstitutionList& substitutions) const
{
    const Substitution* sub = findSubstitution(substitutions, var);
    if (sub == nullptr) {
        HOMOG_THROW_WITH(VariableLookupException, var,
                         "DiscreteFormProblem: expression '" + expression +
                         "' evaluated without a substitution");
    }

    const auto expected = variables_.get(var).numDofs();
    HOMOG_THROW_IF(sub->value.size() != expected, InvalidArgumentException,
                   "DiscreteFormProblem: substitution for '" + var + "' has " +
                   std::to_string(sub->value.size()) + " entries, expected " +
                   std::to_string(expected));
    return sub->value;
}

Real DiscreteFormProblem::evaluateIntegral(std::string_view expression,
                                           const SubstitutionList& substitutions) const
{
    const std::string key(expression);
    auto it = forms_.find(key);
    HOMOG_THROW_IF(it == forms_.end(), InvalidArgumentException,
                   "DiscreteFormProblem::evaluateIntegral: unknown expression '" + key + "'");

    const Form& form = it->second;
    const FieldVector& v = substitutedValue(key, form.test_var, substitutions);

    if (form.trial_var.empty()) {
        return form.vector.dot(v);
    }

    const FieldVector& u = substitutedValue(key, form.trial_var, substitutions);
    const FieldVector ku = form.matrix * u;
    return v.dot(ku);
}

} // namespace problem
} // namespace Homog
} // namespace mshc
