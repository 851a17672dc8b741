/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#ifndef MSHC_HOMOG_SYMMETRICINDEXING_H
#define MSHC_HOMOG_SYMMETRICINDEXING_H

/**
 * @file SymmetricIndexing.h
 * @brief Ordering of the symmetric index set of a rank-2 tensor
 *
 * Diagonal pairs come first, then the strict upper triangle row by row:
 *
 *   dim = 2:  (0,0) (1,1) (0,1)
 *   dim = 3:  (0,0) (1,1) (2,2) (0,1) (0,2) (1,2)
 *
 * Note the 3D order differs from the mechanics Voigt convention
 * [11, 22, 33, 23, 13, 12]; it is the ordering in which corrector families
 * are computed and must not be mixed with Voigt-ordered material data.
 */

#include "Types.h"

#include <vector>

namespace mshc {
namespace Homog {
namespace symmetry {

/**
 * @brief Number of independent entries of a symmetric dim x dim tensor
 */
[[nodiscard]] constexpr int symSize(int dim) noexcept {
    return dim * (dim + 1) / 2;
}

/**
 * @brief Symmetric index pairs in storage order
 */
[[nodiscard]] std::vector<IndexPair> iterSym(int dim);

/**
 * @brief All dim x dim index pairs, row-major
 */
[[nodiscard]] std::vector<IndexPair> iterDimDim(int dim);

/**
 * @brief Storage index of (i, j); symmetric in its arguments
 */
[[nodiscard]] TensorIndex symIndex(int dim, TensorIndex i, TensorIndex j);

/**
 * @brief Index pair stored at symmetric position @p k
 */
[[nodiscard]] IndexPair symPair(int dim, TensorIndex k);

/**
 * @brief Throw InvalidArgumentException unless 1 <= dim <= MAX_SPATIAL_DIM
 */
void checkDimension(int dim);

} // namespace symmetry
} // namespace Homog
} // namespace mshc

#endif // MSHC_HOMOG_SYMMETRICINDEXING_H
