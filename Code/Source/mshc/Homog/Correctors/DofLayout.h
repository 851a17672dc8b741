/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#ifndef MSHC_HOMOG_CORRECTORS_DOFLAYOUT_H
#define MSHC_HOMOG_CORRECTORS_DOFLAYOUT_H

#include "Core/Types.h"
#include "Core/HomogException.h"

#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace mshc {
namespace Homog {
namespace correctors {

/**
 * @brief Layout of primary variables inside a concatenated state vector
 *
 * Maps each primary-variable name to the contiguous half-open range
 * [start, end) its DOFs occupy. Fields are appended in order by
 * addField(name, n_dofs) or placed explicitly; explicit ranges must not
 * overlap. A layout is shared by every state of a corrector and becomes
 * immutable after finalize().
 */
class DofLayout {
public:
    DofLayout() = default;

    /**
     * @brief Append a field after the current end of the layout
     * @return Field index
     */
    int addField(const std::string& name, GlobalIndex n_dofs);

    /**
     * @brief Add a field occupying [start_dof, end_dof)
     */
    int addField(const std::string& name, GlobalIndex start_dof, GlobalIndex end_dof);

    void finalize();

    [[nodiscard]] bool isFinalized() const noexcept { return finalized_; }
    [[nodiscard]] std::size_t numFields() const noexcept { return fields_.size(); }
    [[nodiscard]] GlobalIndex totalDofs() const noexcept { return total_dofs_; }
    [[nodiscard]] bool has(std::string_view name) const noexcept;

    /**
     * @brief DOF range of a primary variable
     * @throws VariableLookupException if the name is not part of the layout
     */
    [[nodiscard]] std::pair<GlobalIndex, GlobalIndex> range(std::string_view name) const;

    [[nodiscard]] GlobalIndex fieldSize(std::string_view name) const;

    [[nodiscard]] std::vector<std::string> fieldNames() const;

    /**
     * @brief Copy the sub-vector of @p state that belongs to @p name
     */
    [[nodiscard]] FieldVector extract(const FieldVector& state, std::string_view name) const;

    bool operator==(const DofLayout& other) const;
    bool operator!=(const DofLayout& other) const { return !(*this == other); }

private:
    struct FieldInfo {
        std::string name;
        GlobalIndex start_dof{0};
        GlobalIndex end_dof{0};
    };

    const FieldInfo& field(std::string_view name) const;
    void checkNotFinalized() const;

    std::vector<FieldInfo> fields_;
    std::unordered_map<std::string, std::size_t> name_to_index_;
    GlobalIndex total_dofs_{0};
    bool finalized_{false};
};

} // namespace correctors
} // namespace Homog
} // namespace mshc

#endif // MSHC_HOMOG_CORRECTORS_DOFLAYOUT_H
