/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#include "Correctors/PerturbationField.h"

namespace mshc {
namespace Homog {
namespace correctors {

void PerturbationField::set(IndexPair pair, FieldVector value)
{
    HOMOG_THROW_IF(value.size() == 0, InvalidArgumentException,
                   "PerturbationField '" + name_ + "': empty field for pair " + to_string(pair));
    HOMOG_THROW_IF(field_size_ != INVALID_GLOBAL_INDEX && value.size() != field_size_,
                   InvalidArgumentException,
                   "PerturbationField '" + name_ + "': field for pair " + to_string(pair) +
                   " has " + std::to_string(value.size()) + " entries, expected " +
                   std::to_string(field_size_));

    field_size_ = static_cast<GlobalIndex>(value.size());
    values_[pair] = std::move(value);
}

const FieldVector& PerturbationField::value(IndexPair pair) const
{
    auto it = values_.find(pair);
    if (it == values_.end()) {
        throw UnknownIndexPairException("PerturbationField '" + name_ + "': no field for pair",
                                        pair, NO_STEP, __FILE__, __LINE__, __FUNCTION__);
    }
    return it->second;
}

std::vector<IndexPair> PerturbationField::pairs() const
{
    std::vector<IndexPair> out;
    out.reserve(values_.size());
    for (const auto& [pair, value] : values_) {
        (void)value;
        out.push_back(pair);
    }
    return out;
}

} // namespace correctors
} // namespace Homog
} // namespace mshc
