/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#ifndef MSHC_HOMOG_COEFFICIENTS_ELASTICCOEFFICIENTS_H
#define MSHC_HOMOG_COEFFICIENTS_ELASTICCOEFFICIENTS_H

/**
 * @file ElasticCoefficients.h
 * @brief Coefficients of linear elastic and poroelastic unit cells
 *
 * With correctors w^{ij} solving the unit-cell problem for unit strains and
 * base fields pi^{ij}, the homogenized quantities are
 *
 *   E_{ijkl} = 1/|Y| a_Y(pi^{ij} + w^{ij}, pi^{kl} + w^{kl})
 *   B_{ij}   = 1/|Y| b_Y(w^{ij}, 1)
 *
 * The factories below configure CoefficientEvaluator for each of them.
 */

#include "Coefficients/CoefficientEvaluator.h"

#include <string>
#include <vector>

namespace mshc {
namespace Homog {
namespace coefs {

/**
 * @brief Rank-4 elastic tensor (SymSym)
 *
 * Row substitutes variables[0], col variables[1], each with
 * pis(ir, ic) + the corrector's primary-variable block at (ir, ic).
 *
 * @param variables  {row variable, col variable}
 * @param pis        Perturbation-field dependency
 * @param correctors Corrector dependency
 */
[[nodiscard]] CoefficientEvaluator makeElasticCoef(const std::string& name,
                                                   std::vector<std::string> variables,
                                                   const std::string& pis,
                                                   const std::string& correctors,
                                                   const std::string& expression);

/**
 * @brief Biot coupling coefficient (Sym)
 *
 * Col substitutes variables[0] with ones; row substitutes variables[1] with
 * the corrector's primary-variable block at (ir, ic).
 */
[[nodiscard]] CoefficientEvaluator makeElasticBiotCoef(const std::string& name,
                                                       std::vector<std::string> variables,
                                                       const std::string& correctors,
                                                       const std::string& expression);

/**
 * @brief Right-hand sides of the elastic corrector problems (DimDim)
 *
 * Substitutes the last variable with pis(ir, ic) for every (ir, ic).
 */
[[nodiscard]] CoefficientEvaluator makeCorrectorsElasticRhs(const std::string& name,
                                                            std::vector<std::string> variables,
                                                            const std::string& pis,
                                                            const std::string& expression);

/**
 * @brief Rank-4 elastic tensor for every step of a time-dependent corrector
 */
[[nodiscard]] CoefficientEvaluator makeElasticCoefTimeSeries(const std::string& name,
                                                             std::vector<std::string> variables,
                                                             const std::string& pis,
                                                             const std::string& correctors,
                                                             const std::string& expression);

} // namespace coefs
} // namespace Homog
} // namespace mshc

#endif // MSHC_HOMOG_COEFFICIENTS_ELASTICCOEFFICIENTS_H
