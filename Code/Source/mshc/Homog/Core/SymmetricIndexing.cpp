/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#include "SymmetricIndexing.h"
#include "HomogException.h"

namespace mshc {
namespace Homog {
namespace symmetry {

void checkDimension(int dim)
{
    HOMOG_THROW_IF(dim < 1 || dim > config::MAX_SPATIAL_DIM, InvalidArgumentException,
                   "symmetry: unsupported spatial dimension " + std::to_string(dim));
}

std::vector<IndexPair> iterSym(int dim)
{
    checkDimension(dim);

    std::vector<IndexPair> pairs;
    pairs.reserve(static_cast<std::size_t>(symSize(dim)));
    for (TensorIndex ii = 0; ii < dim; ++ii) {
        pairs.emplace_back(ii, ii);
    }
    for (TensorIndex ir = 0; ir < dim; ++ir) {
        for (TensorIndex ic = ir + 1; ic < dim; ++ic) {
            pairs.emplace_back(ir, ic);
        }
    }
    return pairs;
}

std::vector<IndexPair> iterDimDim(int dim)
{
    checkDimension(dim);

    std::vector<IndexPair> pairs;
    pairs.reserve(static_cast<std::size_t>(dim * dim));
    for (TensorIndex ir = 0; ir < dim; ++ir) {
        for (TensorIndex ic = 0; ic < dim; ++ic) {
            pairs.emplace_back(ir, ic);
        }
    }
    return pairs;
}

TensorIndex symIndex(int dim, TensorIndex i, TensorIndex j)
{
    checkDimension(dim);
    HOMOG_THROW_IF(i < 0 || i >= dim || j < 0 || j >= dim, InvalidArgumentException,
                   "symmetry::symIndex: index " + to_string(IndexPair{i, j}) +
                   " out of range for dim " + std::to_string(dim));

    if (i == j) {
        return i;
    }
    const TensorIndex lo = (i < j) ? i : j;
    const TensorIndex hi = (i < j) ? j : i;

    // Off-diagonal entries of rows above `lo` precede row `lo`.
    TensorIndex offset = dim;
    for (TensorIndex r = 0; r < lo; ++r) {
        offset += dim - r - 1;
    }
    return offset + (hi - lo - 1);
}

IndexPair symPair(int dim, TensorIndex k)
{
    checkDimension(dim);
    HOMOG_THROW_IF(k < 0 || k >= symSize(dim), InvalidArgumentException,
                   "symmetry::symPair: storage index " + std::to_string(k) +
                   " out of range for dim " + std::to_string(dim));

    if (k < dim) {
        return {k, k};
    }
    TensorIndex rest = k - dim;
    for (TensorIndex ir = 0; ir < dim; ++ir) {
        const TensorIndex row_len = dim - ir - 1;
        if (rest < row_len) {
            return {ir, ir + 1 + rest};
        }
        rest -= row_len;
    }
    HOMOG_THROW(HomogException, "symmetry::symPair: inconsistent storage index");
}

} // namespace symmetry
} // namespace Homog
} // namespace mshc
