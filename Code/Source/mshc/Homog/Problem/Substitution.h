/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#ifndef MSHC_HOMOG_PROBLEM_SUBSTITUTION_H
#define MSHC_HOMOG_PROBLEM_SUBSTITUTION_H

/**
 * @file Substitution.h
 * @brief Variable substitutions handed to the integration engine
 */

#include "Core/Types.h"

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace mshc {
namespace Homog {
namespace problem {

/**
 * @brief Field value to substitute for one variable of a weak-form integral
 */
struct Substitution {
    std::string variable;
    FieldVector value;

    Substitution() = default;
    Substitution(std::string name, FieldVector field)
        : variable(std::move(name)), value(std::move(field)) {}
};

/**
 * @brief Finite, restartable sequence of substitutions for one tensor entry
 */
using SubstitutionList = std::vector<Substitution>;

/**
 * @brief Find the substitution for @p variable, or nullptr
 *
 * When a list carries the same variable twice the last record wins, matching
 * the order in which the integration engine would apply them.
 */
inline const Substitution* findSubstitution(const SubstitutionList& subs,
                                            std::string_view variable) noexcept
{
    const Substitution* found = nullptr;
    for (const auto& sub : subs) {
        if (sub.variable == variable) {
            found = &sub;
        }
    }
    return found;
}

} // namespace problem
} // namespace Homog
} // namespace mshc

#endif // MSHC_HOMOG_PROBLEM_SUBSTITUTION_H
