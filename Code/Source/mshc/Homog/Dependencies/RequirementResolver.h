/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#ifndef MSHC_HOMOG_DEPENDENCIES_REQUIREMENTRESOLVER_H
#define MSHC_HOMOG_DEPENDENCIES_REQUIREMENTRESOLVER_H

/**
 * @file RequirementResolver.h
 * @brief Computes named dependencies once, in dependency order
 *
 * Every named item (corrector, perturbation field, coefficient) is registered
 * with the names it requires and a producer. resolve() walks the requirement
 * graph depth-first, runs each producer at most once with a DependencyMap of
 * exactly its requirements, and caches the result for later calls.
 *
 * @code
 *   RequirementResolver resolver;
 *   resolver.addValue("corrs_rs", corrector_store);
 *   resolver.addProducer("pis", {}, [&](const DependencyMap&) {
 *       return DependencyValue{std::make_shared<const PerturbationField>(
 *           createShapeDimDim(problem, "u"))};
 *   });
 *   auto data = resolver.resolve({"pis", "corrs_rs"});
 * @endcode
 */

#include "Dependencies/DependencyMap.h"

#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace mshc {
namespace Homog {
namespace dependencies {

class RequirementResolver {
public:
    using Producer = std::function<DependencyValue(const DependencyMap& requirements)>;

    /**
     * @brief Register a producer for @p name
     *
     * @param requirements Names that must be resolved before the producer runs
     */
    void addProducer(const std::string& name,
                     std::vector<std::string> requirements,
                     Producer producer);

    /**
     * @brief Register an already computed value (e.g. a solved corrector)
     */
    void addValue(const std::string& name, DependencyValue value);

    [[nodiscard]] bool has(const std::string& name) const noexcept;
    [[nodiscard]] bool isCached(const std::string& name) const noexcept;
    [[nodiscard]] const std::vector<std::string>& requirementsOf(const std::string& name) const;

    /**
     * @brief Resolve @p names and return them as one map
     *
     * @throws MissingDependencyException for names without a producer
     * @throws HomogException with DependencyCycle status for cyclic requirements
     */
    [[nodiscard]] DependencyMap resolve(const std::vector<std::string>& names);

    /**
     * @brief Drop every computed value; registered values are kept
     */
    void clearCache();

private:
    struct Entry {
        std::vector<std::string> requirements;
        Producer producer;           // empty for registered values
    };

    const DependencyValue& compute(const std::string& name, std::vector<std::string>& stack);

    std::unordered_map<std::string, Entry> entries_;
    std::unordered_map<std::string, DependencyValue> cache_;
};

} // namespace dependencies
} // namespace Homog
} // namespace mshc

#endif // MSHC_HOMOG_DEPENDENCIES_REQUIREMENTRESOLVER_H
