/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#ifndef MSHC_HOMOG_PROBLEM_DISCRETEFORMPROBLEM_H
#define MSHC_HOMOG_PROBLEM_DISCRETEFORMPROBLEM_H

/**
 * @file DiscreteFormProblem.h
 * @brief Problem context backed by precomputed discrete weak forms
 *
 * Integrals are algebraic forms over nodal DOF vectors:
 *
 *   bilinear:  a(v, u) = v^T K u
 *   linear:    l(v)    = f^T v
 *
 * where K (resp. f) is the matrix (resp. vector) an external assembler
 * produced for the unit cell. Evaluating a coefficient entry then only needs
 * the substituted fields. Forms are immutable after registration, so
 * evaluateIntegral() is safe to call concurrently.
 */

#include "Problem/ProblemContext.h"

#include <Eigen/Sparse>

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace mshc {
namespace Homog {
namespace problem {

class DiscreteFormProblem final : public ProblemContext {
public:
    using SparseMatrix = Eigen::SparseMatrix<Real>;

    DiscreteFormProblem(int dim, VariableRegistry variables);

    /**
     * @brief Register a bilinear form v^T K u between two variables
     *
     * @param expression Name used by coefficient definitions
     * @param test_var   Variable substituted into v (rows of K)
     * @param trial_var  Variable substituted into u (columns of K)
     */
    void addBilinearForm(const std::string& expression,
                         const std::string& test_var,
                         const std::string& trial_var,
                         SparseMatrix matrix);

    /**
     * @brief Register a linear form f^T v
     */
    void addLinearForm(const std::string& expression,
                       const std::string& test_var,
                       FieldVector vector);

    [[nodiscard]] bool hasExpression(std::string_view expression) const noexcept;

    [[nodiscard]] int dimension() const override { return dim_; }
    [[nodiscard]] const VariableInfo& variable(std::string_view name) const override;
    [[nodiscard]] const Eigen::MatrixXd& nodeCoordinates(std::string_view name) const override;
    [[nodiscard]] Real evaluateIntegral(std::string_view expression,
                                        const SubstitutionList& substitutions) const override;

    [[nodiscard]] const VariableRegistry& variables() const noexcept { return variables_; }

private:
    struct Form {
        std::string test_var;
        std::string trial_var;      // empty for linear forms
        SparseMatrix matrix;
        FieldVector vector;
    };

    const FieldVector& substitutedValue(const std::string& expression,
                                        const std::string& var,
                                        const SubstitutionList& substitutions) const;
    void checkUnusedName(const std::string& expression) const;

    int dim_;
    VariableRegistry variables_;
    std::unordered_map<std::string, Form> forms_;
};

} // namespace problem
} // namespace Homog
} // namespace mshc

#endif // MSHC_HOMOG_PROBLEM_DISCRETEFORMPROBLEM_H
