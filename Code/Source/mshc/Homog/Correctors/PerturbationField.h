/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#ifndef MSHC_HOMOG_CORRECTORS_PERTURBATIONFIELD_H
#define MSHC_HOMOG_CORRECTORS_PERTURBATIONFIELD_H

#include "Core/Types.h"
#include "Core/HomogException.h"

#include <map>
#include <string>
#include <vector>

namespace mshc {
namespace Homog {
namespace correctors {

/**
 * @brief Base unit-load fields ("pis") keyed by macroscopic index pair
 *
 * Every value has the same length (one nodal field of the variable the
 * fields were built for). Built once by a shape builder, then read-only.
 */
class PerturbationField {
public:
    explicit PerturbationField(std::string name) : name_(std::move(name)) {}

    /**
     * @brief Store the field for @p pair, replacing any previous value
     */
    void set(IndexPair pair, FieldVector value);

    /**
     * @brief Field stored for @p pair
     * @throws UnknownIndexPairException if no field was stored for the pair
     */
    [[nodiscard]] const FieldVector& value(IndexPair pair) const;

    [[nodiscard]] bool has(IndexPair pair) const noexcept { return values_.count(pair) > 0; }
    [[nodiscard]] std::size_t size() const noexcept { return values_.size(); }
    [[nodiscard]] GlobalIndex fieldSize() const noexcept { return field_size_; }
    [[nodiscard]] std::vector<IndexPair> pairs() const;
    [[nodiscard]] const std::string& name() const noexcept { return name_; }

private:
    std::string name_;
    std::map<IndexPair, FieldVector> values_;
    GlobalIndex field_size_{INVALID_GLOBAL_INDEX};
};

} // namespace correctors
} // namespace Homog
} // namespace mshc

#endif // MSHC_HOMOG_CORRECTORS_PERTURBATIONFIELD_H
