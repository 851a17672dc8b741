/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#ifndef MSHC_HOMOG_DEPENDENCIES_DEPENDENCYMAP_H
#define MSHC_HOMOG_DEPENDENCIES_DEPENDENCYMAP_H

/**
 * @file DependencyMap.h
 * @brief Resolved dependency data handed to coefficient evaluators
 *
 * Values are one of a closed set of kinds and are shared read-only with the
 * producer cache. Each kind has its own lookup; asking for a name that is
 * absent or holds a different kind raises MissingDependencyException.
 */

#include "Core/Types.h"
#include "Core/HomogException.h"
#include "Correctors/CorrectorStore.h"
#include "Correctors/PerturbationField.h"
#include "Dependencies/CoefficientResult.h"

#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace mshc {
namespace Homog {
namespace dependencies {

enum class DependencyKind : std::uint8_t {
    Corrector,
    PerturbationField,
    Coefficient
};

inline const char* dependency_kind_to_string(DependencyKind kind) noexcept {
    switch (kind) {
        case DependencyKind::Corrector:         return "Corrector";
        case DependencyKind::PerturbationField: return "PerturbationField";
        case DependencyKind::Coefficient:       return "Coefficient";
        default:                                return "Unknown";
    }
}

using CorrectorPtr = std::shared_ptr<const correctors::CorrectorStore>;
using PerturbationPtr = std::shared_ptr<const correctors::PerturbationField>;
using CoefficientPtr = std::shared_ptr<const CoefficientResult>;

/**
 * @brief One resolved dependency; alternative order matches DependencyKind
 */
using DependencyValue = std::variant<CorrectorPtr, PerturbationPtr, CoefficientPtr>;

[[nodiscard]] DependencyKind kindOf(const DependencyValue& value) noexcept;

class DependencyMap {
public:
    /**
     * @brief Add a resolved value; names are unique and values non-null
     */
    void insert(const std::string& name, DependencyValue value);

    [[nodiscard]] bool has(std::string_view name) const noexcept;
    [[nodiscard]] std::size_t size() const noexcept { return values_.size(); }
    [[nodiscard]] std::vector<std::string> names() const;

    /**
     * @brief Kind stored under @p name
     * @throws MissingDependencyException if the name is absent
     */
    [[nodiscard]] DependencyKind kind(std::string_view name) const;

    [[nodiscard]] const DependencyValue& value(std::string_view name) const;

    [[nodiscard]] const correctors::CorrectorStore& corrector(std::string_view name) const;
    [[nodiscard]] const correctors::PerturbationField& perturbation(std::string_view name) const;
    [[nodiscard]] const CoefficientResult& coefficient(std::string_view name) const;

    /**
     * @brief Throw MissingDependencyException for the first absent name
     */
    void checkContains(const std::vector<std::string>& names) const;

private:
    template<typename T>
    const T& typed(std::string_view name, DependencyKind expected) const;

    std::map<std::string, DependencyValue, std::less<>> values_;
};

} // namespace dependencies
} // namespace Homog
} // namespace mshc

#endif // MSHC_HOMOG_DEPENDENCIES_DEPENDENCYMAP_H
