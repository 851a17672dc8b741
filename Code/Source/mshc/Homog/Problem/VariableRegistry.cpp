/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#include "Problem/VariableRegistry.h"

namespace mshc {
namespace Homog {
namespace problem {

void VariableRegistry::add(VariableSpec spec)
{
    HOMOG_THROW_IF(spec.name.empty(), InvalidArgumentException,
                   "VariableRegistry::add: empty variable name");
    HOMOG_THROW_IF(name_to_index_.count(spec.name) > 0, InvalidArgumentException,
                   "VariableRegistry::add: variable '" + spec.name + "' already exists");
    HOMOG_THROW_IF(spec.n_nod < 0, InvalidArgumentException,
                   "VariableRegistry::add: negative node count for '" + spec.name + "'");
    HOMOG_THROW_IF(spec.n_components < 1, InvalidArgumentException,
                   "VariableRegistry::add: variable '" + spec.name + "' needs at least one component");
    HOMOG_THROW_IF(spec.coordinates.size() > 0 && spec.coordinates.rows() != spec.n_nod,
                   InvalidArgumentException,
                   "VariableRegistry::add: coordinate rows do not match node count for '" +
                   spec.name + "'");

    Record rec;
    rec.info.name = spec.name;
    rec.info.primary_var_name = spec.primary_var_name.empty() ? spec.name : spec.primary_var_name;
    rec.info.n_nod = spec.n_nod;
    rec.info.n_components = spec.n_components;
    rec.coordinates = std::move(spec.coordinates);

    name_to_index_.emplace(rec.info.name, records_.size());
    records_.push_back(std::move(rec));
}

const VariableRegistry::Record& VariableRegistry::record(std::string_view name) const
{
    auto it = name_to_index_.find(std::string(name));
    if (it == name_to_index_.end()) {
        HOMOG_THROW_WITH(VariableLookupException, std::string(name),
                         "VariableRegistry: unknown variable");
    }
    return records_[it->second];
}

const VariableInfo& VariableRegistry::get(std::string_view name) const
{
    return record(name).info;
}

const Eigen::MatrixXd& VariableRegistry::coordinates(std::string_view name) const
{
    const auto& rec = record(name);
    if (rec.coordinates.size() == 0) {
        HOMOG_THROW_WITH(VariableLookupException, std::string(name),
                         "VariableRegistry::coordinates: no node coordinates registered");
    }
    return rec.coordinates;
}

bool VariableRegistry::has(std::string_view name) const noexcept
{
    return name_to_index_.count(std::string(name)) > 0;
}

std::vector<std::string> VariableRegistry::names() const
{
    std::vector<std::string> out;
    out.reserve(records_.size());
    for (const auto& rec : records_) {
        out.push_back(rec.info.name);
    }
    return out;
}

} // namespace problem
} // namespace Homog
} // namespace mshc
