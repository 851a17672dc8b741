/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#ifndef MSHC_HOMOG_CORRECTORS_SHAPEFIELDS_H
#define MSHC_HOMOG_CORRECTORS_SHAPEFIELDS_H

/**
 * @file ShapeFields.h
 * @brief Builders for the base fields of unit macroscopic loads
 *
 * For a vector variable u with node coordinates X (n_nod x dim), the
 * shape-pair field of (ir, ic) is the linear displacement
 *
 *   pi^{ir,ic}_k(X) = delta_{k,ir} X_ic
 *
 * stored node-major with interleaved components (entry n*dim + k). For a
 * scalar variable the field of (ir, 0) is the coordinate X_ir itself.
 */

#include "Correctors/PerturbationField.h"
#include "Problem/ProblemContext.h"

#include <string>

namespace mshc {
namespace Homog {
namespace correctors {

/**
 * @brief Shape-pair fields for every (ir, ic) in the dim x dim range
 *
 * @param variable Vector variable with dim components per node
 */
[[nodiscard]] PerturbationField createShapeDimDim(const problem::ProblemContext& problem,
                                                  const std::string& variable,
                                                  const std::string& name = "pis");

/**
 * @brief Coordinate fields (ir, 0), ir < dim, of a scalar variable
 */
[[nodiscard]] PerturbationField createShapeDim(const problem::ProblemContext& problem,
                                               const std::string& variable,
                                               const std::string& name = "pis");

} // namespace correctors
} // namespace Homog
} // namespace mshc

#endif // MSHC_HOMOG_CORRECTORS_SHAPEFIELDS_H
