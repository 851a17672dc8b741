/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#include "Dependencies/DependencyMap.h"

namespace mshc {
namespace Homog {
namespace dependencies {

DependencyKind kindOf(const DependencyValue& value) noexcept
{
    return static_cast<DependencyKind>(value.index());
}

void DependencyMap::insert(const std::string& name, DependencyValue value)
{
    HOMOG_THROW_IF(name.empty(), InvalidArgumentException, "DependencyMap::insert: empty name");
    HOMOG_THROW_IF(values_.count(name) > 0, InvalidArgumentException,
                   "DependencyMap::insert: dependency '" + name + "' already present");

    const bool is_null = std::visit([](const auto& ptr) { return ptr == nullptr; }, value);
    HOMOG_THROW_IF(is_null, InvalidArgumentException,
                   "DependencyMap::insert: null value for dependency '" + name + "'");

    values_.emplace(name, std::move(value));
}

bool DependencyMap::has(std::string_view name) const noexcept
{
    return values_.find(name) != values_.end();
}

std::vector<std::string> DependencyMap::names() const
{
    std::vector<std::string> out;
    out.reserve(values_.size());
    for (const auto& kv : values_) {
        out.push_back(kv.first);
    }
    return out;
}

const DependencyValue& DependencyMap::value(std::string_view name) const
{
    auto it = values_.find(name);
    if (it == values_.end()) {
        HOMOG_THROW_WITH(MissingDependencyException, std::string(name),
                         "DependencyMap: dependency has not been resolved");
    }
    return it->second;
}

DependencyKind DependencyMap::kind(std::string_view name) const
{
    return kindOf(value(name));
}

template<typename T>
const T& DependencyMap::typed(std::string_view name, DependencyKind expected) const
{
    const auto& v = value(name);
    const auto actual = kindOf(v);
    if (actual != expected) {
        HOMOG_THROW_WITH(MissingDependencyException, std::string(name),
                         std::string("DependencyMap: expected a ") +
                         dependency_kind_to_string(expected) + ", found a " +
                         dependency_kind_to_string(actual));
    }
    return *std::get<std::shared_ptr<const T>>(v);
}

const correctors::CorrectorStore& DependencyMap::corrector(std::string_view name) const
{
    return typed<correctors::CorrectorStore>(name, DependencyKind::Corrector);
}

const correctors::PerturbationField& DependencyMap::perturbation(std::string_view name) const
{
    return typed<correctors::PerturbationField>(name, DependencyKind::PerturbationField);
}

const CoefficientResult& DependencyMap::coefficient(std::string_view name) const
{
    return typed<CoefficientResult>(name, DependencyKind::Coefficient);
}

void DependencyMap::checkContains(const std::vector<std::string>& names) const
{
    for (const auto& name : names) {
        if (!has(name)) {
            HOMOG_THROW_WITH(MissingDependencyException, name,
                             "DependencyMap: required dependency is missing");
        }
    }
}

} // namespace dependencies
} // namespace Homog
} // namespace mshc
