/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#ifndef MSHC_HOMOG_PROBLEM_PROBLEMCONTEXT_H
#define MSHC_HOMOG_PROBLEM_PROBLEMCONTEXT_H

/**
 * @file ProblemContext.h
 * @brief Interface to the unit-cell problem that owns variables and integrals
 *
 * The problem context is supplied by the weak-form engine. Coefficient
 * evaluators use it to map declared variable names to primary-variable names
 * and field metadata; the tensor assembler uses it to integrate one tensor
 * entry from a list of substitutions.
 *
 * Module boundaries:
 * - This module OWNS: the lookup and integration contract
 * - This module does NOT OWN: meshes, quadrature, term assembly
 *
 * Implementations must allow concurrent const calls; tensor entries may be
 * evaluated from several threads.
 */

#include "Core/Types.h"
#include "Problem/Substitution.h"
#include "Problem/VariableRegistry.h"

#include <string>
#include <string_view>

namespace mshc {
namespace Homog {
namespace problem {

class ProblemContext {
public:
    virtual ~ProblemContext() = default;

    /**
     * @brief Spatial dimension of the unit cell
     */
    [[nodiscard]] virtual int dimension() const = 0;

    /**
     * @brief Metadata of a declared variable
     * @throws VariableLookupException if the name is unknown
     */
    [[nodiscard]] virtual const VariableInfo& variable(std::string_view name) const = 0;

    /**
     * @brief Node coordinates (n_nod x dim) of the field a variable lives on
     */
    [[nodiscard]] virtual const Eigen::MatrixXd& nodeCoordinates(std::string_view name) const = 0;

    /**
     * @brief Integrate @p expression with the given variable substitutions
     */
    [[nodiscard]] virtual Real evaluateIntegral(std::string_view expression,
                                                const SubstitutionList& substitutions) const = 0;

    [[nodiscard]] const std::string& primaryVariableName(std::string_view name) const {
        return variable(name).primary_var_name;
    }
};

} // namespace problem
} // namespace Homog
} // namespace mshc

#endif // MSHC_HOMOG_PROBLEM_PROBLEMCONTEXT_H
