/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#include "Dependencies/CoefficientResult.h"

#include "Core/SymmetricIndexing.h"

#include <utility>

namespace mshc {
namespace Homog {
namespace dependencies {

namespace {

std::pair<Eigen::Index, Eigen::Index> expectedShape(CoefficientClass kind, int dim)
{
    const int sym = symmetry::symSize(dim);
    switch (kind) {
        case CoefficientClass::SymSym:
        case CoefficientClass::TimeSeries:
            return {sym, sym};
        case CoefficientClass::Sym:
            return {sym, 1};
        case CoefficientClass::DimDim:
            return {dim, dim};
    }
    HOMOG_THROW(InvalidArgumentException, "CoefficientResult: unknown coefficient class");
}

} // namespace

CoefficientResult::CoefficientResult(std::string name, CoefficientClass kind, int dim,
                                     std::vector<DenseTensor> steps)
    : name_(std::move(name)), kind_(kind), dim_(dim), steps_(std::move(steps))
{
    symmetry::checkDimension(dim_);
    HOMOG_THROW_IF(steps_.empty(), InvalidArgumentException,
                   "CoefficientResult '" + name_ + "': no tensor data");
    HOMOG_THROW_IF(kind_ != CoefficientClass::TimeSeries && steps_.size() != 1,
                   InvalidArgumentException,
                   "CoefficientResult '" + name_ + "': only time series hold several steps");

    const auto [rows, cols] = expectedShape(kind_, dim_);
    for (const auto& t : steps_) {
        HOMOG_THROW_IF(t.rows() != rows || t.cols() != cols, InvalidArgumentException,
                       "CoefficientResult '" + name_ + "': tensor is " +
                       std::to_string(t.rows()) + "x" + std::to_string(t.cols()) +
                       ", expected " + std::to_string(rows) + "x" + std::to_string(cols) +
                       " for class " + coefficient_class_to_string(kind_));
    }
}

const DenseTensor& CoefficientResult::tensor(StepIndex step) const
{
    HOMOG_THROW_IF(step < 0 || step >= numSteps(), InvalidArgumentException,
                   "CoefficientResult '" + name_ + "': step " + std::to_string(step) +
                   " out of range [0, " + std::to_string(numSteps()) + ")");
    return steps_[static_cast<std::size_t>(step)];
}

Real CoefficientResult::component(int i, int j, int k, int l, StepIndex step) const
{
    HOMOG_THROW_IF(kind_ != CoefficientClass::SymSym && kind_ != CoefficientClass::TimeSeries,
                   InvalidArgumentException,
                   "CoefficientResult '" + name_ + "': rank-4 access on a " +
                   coefficient_class_to_string(kind_) + " result");
    checkIndex(i);
    checkIndex(j);
    checkIndex(k);
    checkIndex(l);

    const auto& t = tensor(step);
    return t(symmetry::symIndex(dim_, i, j), symmetry::symIndex(dim_, k, l));
}

Real CoefficientResult::component(int i, int j) const
{
    checkIndex(i);
    checkIndex(j);

    const auto& t = tensor(0);
    switch (kind_) {
        case CoefficientClass::Sym:
            return t(symmetry::symIndex(dim_, i, j), 0);
        case CoefficientClass::DimDim:
            return t(i, j);
        default:
            HOMOG_THROW(InvalidArgumentException,
                        "CoefficientResult '" + name_ + "': rank-2 access on a " +
                        coefficient_class_to_string(kind_) + " result");
    }
}

void CoefficientResult::checkIndex(int i) const
{
    HOMOG_THROW_IF(i < 0 || i >= dim_, InvalidArgumentException,
                   "CoefficientResult '" + name_ + "': index " + std::to_string(i) +
                   " out of range for dimension " + std::to_string(dim_));
}

} // namespace dependencies
} // namespace Homog
} // namespace mshc
