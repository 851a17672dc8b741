/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#ifndef MSHC_HOMOG_CORRECTORS_CORRECTORSTORE_H
#define MSHC_HOMOG_CORRECTORS_CORRECTORSTORE_H

/**
 * @file CorrectorStore.h
 * @brief Precomputed unit-cell responses to unit macroscopic loads
 *
 * A corrector holds one concatenated state vector (all primary variables
 * stacked according to a DofLayout) for every macroscopic index pair in a
 * declared range, and optionally for every time step. The corrector-solving
 * engine fills the store with setState() and calls finalize(); afterwards the
 * store is read-only and shared as std::shared_ptr<const CorrectorStore>.
 */

#include "Core/Types.h"
#include "Core/HomogException.h"
#include "Correctors/DofLayout.h"

#include <string>
#include <string_view>
#include <vector>

namespace mshc {
namespace Homog {
namespace correctors {

/**
 * @brief Rectangular range of index pairs [0, n_rows) x [0, n_cols)
 */
struct IndexRange {
    int n_rows{0};
    int n_cols{0};

    [[nodiscard]] bool contains(IndexPair pair) const noexcept {
        return pair.ir >= 0 && pair.ir < n_rows && pair.ic >= 0 && pair.ic < n_cols;
    }
    [[nodiscard]] int numPairs() const noexcept { return n_rows * n_cols; }

    /**
     * @brief Full dim x dim range used by shape-pair correctors
     */
    static IndexRange square(int dim) { return IndexRange{dim, dim}; }
};

class CorrectorStore {
public:
    /**
     * @brief Create an empty store
     *
     * @param name    Dependency name of the corrector (for diagnostics)
     * @param layout  Finalized layout shared by every state
     * @param range   Index pairs the corrector is defined for
     * @param n_steps Number of time steps; 0 for a static corrector
     */
    CorrectorStore(std::string name, DofLayout layout, IndexRange range, int n_steps = 0);

    // =========================================================================
    // Filling
    // =========================================================================

    void setState(IndexPair pair, FieldVector state);
    void setState(IndexPair pair, StepIndex step, FieldVector state);

    /**
     * @brief Check that every pair (and step) has a state and freeze the store
     */
    void finalize();

    // =========================================================================
    // Queries
    // =========================================================================

    /**
     * @brief Full concatenated state of a static corrector
     * @throws UnknownIndexPairException if the pair is outside the range or unset
     */
    [[nodiscard]] const FieldVector& state(IndexPair pair) const;
    [[nodiscard]] const FieldVector& state(IndexPair pair, StepIndex step) const;

    /**
     * @brief Sub-vector of a primary variable in the state at @p pair
     * @throws VariableLookupException if the variable is not in the layout
     */
    [[nodiscard]] FieldVector extract(IndexPair pair, std::string_view primary_name) const;
    [[nodiscard]] FieldVector extract(IndexPair pair, StepIndex step,
                                      std::string_view primary_name) const;

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] const DofLayout& layout() const noexcept { return layout_; }
    [[nodiscard]] const IndexRange& indexRange() const noexcept { return range_; }
    [[nodiscard]] int numTimeSteps() const noexcept { return n_steps_; }
    [[nodiscard]] bool isTimeDependent() const noexcept { return n_steps_ > 0; }
    [[nodiscard]] bool isFinalized() const noexcept { return finalized_; }

private:
    std::size_t slot(IndexPair pair, StepIndex step) const;
    void store(IndexPair pair, StepIndex step, FieldVector state);
    const FieldVector& lookup(IndexPair pair, StepIndex step) const;

    std::string name_;
    DofLayout layout_;
    IndexRange range_;
    int n_steps_{0};

    std::vector<FieldVector> states_;
    std::vector<char> is_set_;
    bool finalized_{false};
};

} // namespace correctors
} // namespace Homog
} // namespace mshc

#endif // MSHC_HOMOG_CORRECTORS_CORRECTORSTORE_H
