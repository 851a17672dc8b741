/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#ifndef MSHC_HOMOG_DEPENDENCIES_COEFFICIENTRESULT_H
#define MSHC_HOMOG_DEPENDENCIES_COEFFICIENTRESULT_H

#include "Core/Types.h"
#include "Core/HomogException.h"

#include <string>
#include <vector>

namespace mshc {
namespace Homog {
namespace dependencies {

/**
 * @brief A computed homogenized tensor
 *
 * Storage per coefficient class:
 *   SymSym, TimeSeries  sym x sym matrix per step (symmetric index order)
 *   Sym                 sym x 1
 *   DimDim              dim x dim
 *
 * Only time-series results have more than one step.
 */
class CoefficientResult {
public:
    CoefficientResult(std::string name, CoefficientClass kind, int dim,
                      std::vector<DenseTensor> steps);

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] CoefficientClass coefficientClass() const noexcept { return kind_; }
    [[nodiscard]] int dimension() const noexcept { return dim_; }
    [[nodiscard]] int numSteps() const noexcept { return static_cast<int>(steps_.size()); }

    /**
     * @brief Stored tensor of one step
     */
    [[nodiscard]] const DenseTensor& tensor(StepIndex step = 0) const;
    [[nodiscard]] const std::vector<DenseTensor>& steps() const noexcept { return steps_; }

    /**
     * @brief Full rank-4 component C_ijkl of a SymSym or TimeSeries result
     */
    [[nodiscard]] Real component(int i, int j, int k, int l, StepIndex step = 0) const;

    /**
     * @brief Full rank-2 component of a Sym or DimDim result
     */
    [[nodiscard]] Real component(int i, int j) const;

private:
    void checkIndex(int i) const;

    std::string name_;
    CoefficientClass kind_;
    int dim_;
    std::vector<DenseTensor> steps_;
};

} // namespace dependencies
} // namespace Homog
} // namespace mshc

#endif // MSHC_HOMOG_DEPENDENCIES_COEFFICIENTRESULT_H
