/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#include "Correctors/DofLayout.h"

#include <algorithm>

namespace mshc {
namespace Homog {
namespace correctors {

// =============================================================================
// Layout Definition
// =============================================================================

int DofLayout::addField(const std::string& name, GlobalIndex n_dofs)
{
    HOMOG_THROW_IF(n_dofs <= 0, InvalidArgumentException,
                   "DofLayout::addField: field '" + name + "' needs a positive DOF count");
    return addField(name, total_dofs_, total_dofs_ + n_dofs);
}

int DofLayout::addField(const std::string& name, GlobalIndex start_dof, GlobalIndex end_dof)
{
    checkNotFinalized();

    HOMOG_THROW_IF(name.empty(), InvalidArgumentException, "DofLayout::addField: empty field name");
    HOMOG_THROW_IF(start_dof < 0 || end_dof <= start_dof, InvalidArgumentException,
                   "DofLayout::addField: invalid DOF range for field '" + name + "'");
    HOMOG_THROW_IF(name_to_index_.count(name) > 0, InvalidArgumentException,
                   "DofLayout::addField: field '" + name + "' already exists");

    for (const auto& other : fields_) {
        const bool overlaps = start_dof < other.end_dof && other.start_dof < end_dof;
        HOMOG_THROW_IF(overlaps, InvalidArgumentException,
                       "DofLayout::addField: field '" + name + "' overlaps field '" +
                       other.name + "'");
    }

    FieldInfo info;
    info.name = name;
    info.start_dof = start_dof;
    info.end_dof = end_dof;

    const auto idx = static_cast<int>(fields_.size());
    fields_.push_back(std::move(info));
    name_to_index_[name] = static_cast<std::size_t>(idx);

    total_dofs_ = std::max(total_dofs_, end_dof);

    return idx;
}

void DofLayout::finalize()
{
    checkNotFinalized();
    HOMOG_THROW_IF(fields_.empty(), InvalidArgumentException,
                   "DofLayout::finalize: layout has no fields");
    finalized_ = true;
}

// =============================================================================
// Queries
// =============================================================================

const DofLayout::FieldInfo& DofLayout::field(std::string_view name) const
{
    auto it = name_to_index_.find(std::string(name));
    if (it == name_to_index_.end()) {
        HOMOG_THROW_WITH(VariableLookupException, std::string(name),
                         "DofLayout: primary variable is not part of the state layout");
    }
    return fields_[it->second];
}

bool DofLayout::has(std::string_view name) const noexcept
{
    return name_to_index_.count(std::string(name)) > 0;
}

std::pair<GlobalIndex, GlobalIndex> DofLayout::range(std::string_view name) const
{
    const auto& info = field(name);
    return {info.start_dof, info.end_dof};
}

GlobalIndex DofLayout::fieldSize(std::string_view name) const
{
    const auto& info = field(name);
    return info.end_dof - info.start_dof;
}

std::vector<std::string> DofLayout::fieldNames() const
{
    std::vector<std::string> names;
    names.reserve(fields_.size());
    for (const auto& info : fields_) {
        names.push_back(info.name);
    }
    return names;
}

FieldVector DofLayout::extract(const FieldVector& state, std::string_view name) const
{
    const auto& info = field(name);
    HOMOG_THROW_IF(state.size() < info.end_dof, InvalidArgumentException,
                   "DofLayout::extract: state of size " + std::to_string(state.size()) +
                   " does not cover field '" + info.name + "'");

    return state.segment(static_cast<Eigen::Index>(info.start_dof),
                         static_cast<Eigen::Index>(info.end_dof - info.start_dof));
}

bool DofLayout::operator==(const DofLayout& other) const
{
    if (fields_.size() != other.fields_.size() || total_dofs_ != other.total_dofs_) {
        return false;
    }
    for (const auto& info : fields_) {
        auto it = other.name_to_index_.find(info.name);
        if (it == other.name_to_index_.end()) {
            return false;
        }
        const auto& o = other.fields_[it->second];
        if (o.start_dof != info.start_dof || o.end_dof != info.end_dof) {
            return false;
        }
    }
    return true;
}

// =============================================================================
// Helpers
// =============================================================================

void DofLayout::checkNotFinalized() const
{
    HOMOG_THROW_IF(finalized_, HomogException,
                   "DofLayout: operation not allowed after finalization");
}

} // namespace correctors
} // namespace Homog
} // namespace mshc
