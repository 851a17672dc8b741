/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#ifndef MSHC_HOMOG_PROBLEM_VARIABLEREGISTRY_H
#define MSHC_HOMOG_PROBLEM_VARIABLEREGISTRY_H

#include "Core/Types.h"
#include "Core/HomogException.h"

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace mshc {
namespace Homog {
namespace problem {

/**
 * @brief Metadata of a weak-form variable
 *
 * Test and parameter variables name the unknown they are paired with in
 * `primary_var_name`; for an unknown it is its own name. Corrector states
 * are laid out by primary-variable name.
 */
struct VariableInfo {
    std::string name;
    std::string primary_var_name;
    GlobalIndex n_nod{0};
    int n_components{1};

    [[nodiscard]] GlobalIndex numDofs() const noexcept { return n_nod * n_components; }
};

struct VariableSpec {
    std::string name;
    std::string primary_var_name;     // empty: the variable is its own primary
    GlobalIndex n_nod{0};
    int n_components{1};
    Eigen::MatrixXd coordinates;      // n_nod x dim, may be empty
};

class VariableRegistry {
public:
    void add(VariableSpec spec);

    /**
     * @brief Look up a variable; throws VariableLookupException if unknown
     */
    [[nodiscard]] const VariableInfo& get(std::string_view name) const;

    /**
     * @brief Node coordinates of the variable's field (n_nod x dim)
     */
    [[nodiscard]] const Eigen::MatrixXd& coordinates(std::string_view name) const;

    [[nodiscard]] bool has(std::string_view name) const noexcept;
    [[nodiscard]] std::size_t size() const noexcept { return records_.size(); }
    [[nodiscard]] std::vector<std::string> names() const;

private:
    struct Record {
        VariableInfo info;
        Eigen::MatrixXd coordinates;
    };

    const Record& record(std::string_view name) const;

    std::vector<Record> records_;
    std::unordered_map<std::string, std::size_t> name_to_index_;
};

} // namespace problem
} // namespace Homog
} // namespace mshc

#endif // MSHC_HOMOG_PROBLEM_VARIABLEREGISTRY_H
