/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#include "Correctors/CorrectorStore.h"

#include "Core/Logger.h"

#include <algorithm>

namespace mshc {
namespace Homog {
namespace correctors {

CorrectorStore::CorrectorStore(std::string name, DofLayout layout, IndexRange range, int n_steps)
    : name_(std::move(name)),
      layout_(std::move(layout)),
      range_(range),
      n_steps_(n_steps)
{
    HOMOG_THROW_IF(!layout_.isFinalized(), InvalidArgumentException,
                   "CorrectorStore '" + name_ + "': layout must be finalized");
    HOMOG_THROW_IF(range_.n_rows <= 0 || range_.n_cols <= 0, InvalidArgumentException,
                   "CorrectorStore '" + name_ + "': empty index range");
    HOMOG_THROW_IF(n_steps_ < 0, InvalidArgumentException,
                   "CorrectorStore '" + name_ + "': negative number of time steps");

    const auto n_slots = static_cast<std::size_t>(range_.numPairs()) *
                         static_cast<std::size_t>(std::max(n_steps_, 1));
    states_.resize(n_slots);
    is_set_.assign(n_slots, 0);
}

// =============================================================================
// Filling
// =============================================================================

void CorrectorStore::setState(IndexPair pair, FieldVector state)
{
    HOMOG_THROW_IF(isTimeDependent(), InvalidArgumentException,
                   "CorrectorStore '" + name_ + "': time-dependent corrector needs a step");
    store(pair, NO_STEP, std::move(state));
}

void CorrectorStore::setState(IndexPair pair, StepIndex step, FieldVector state)
{
    HOMOG_THROW_IF(!isTimeDependent(), InvalidArgumentException,
                   "CorrectorStore '" + name_ + "': static corrector has no time steps");
    store(pair, step, std::move(state));
}

void CorrectorStore::store(IndexPair pair, StepIndex step, FieldVector state)
{
    HOMOG_THROW_IF(finalized_, HomogException,
                   "CorrectorStore '" + name_ + "': store is finalized");
    HOMOG_THROW_IF(state.size() != layout_.totalDofs(), InvalidArgumentException,
                   "CorrectorStore '" + name_ + "': state has " + std::to_string(state.size()) +
                   " entries, layout expects " + std::to_string(layout_.totalDofs()));

    const auto k = slot(pair, step);
    states_[k] = std::move(state);
    is_set_[k] = 1;
}

void CorrectorStore::finalize()
{
    HOMOG_THROW_IF(finalized_, HomogException,
                   "CorrectorStore '" + name_ + "': already finalized");

    const int n_steps = std::max(n_steps_, 1);
    for (int ir = 0; ir < range_.n_rows; ++ir) {
        for (int ic = 0; ic < range_.n_cols; ++ic) {
            for (int step = 0; step < n_steps; ++step) {
                const StepIndex s = isTimeDependent() ? step : NO_STEP;
                if (!is_set_[slot(IndexPair{ir, ic}, s)]) {
                    throw UnknownIndexPairException(
                        "CorrectorStore '" + name_ + "': missing state", IndexPair{ir, ic}, s,
                        __FILE__, __LINE__, __FUNCTION__);
                }
            }
        }
    }

    finalized_ = true;
    HOMOG_LOG_DEBUG("CorrectorStore '" + name_ + "' finalized: " +
                    std::to_string(range_.numPairs()) + " pairs, " +
                    std::to_string(n_steps_) + " steps, " +
                    std::to_string(layout_.totalDofs()) + " dofs per state");
}

// =============================================================================
// Queries
// =============================================================================

const FieldVector& CorrectorStore::state(IndexPair pair) const
{
    HOMOG_THROW_IF(isTimeDependent(), InvalidArgumentException,
                   "CorrectorStore '" + name_ + "': time-dependent corrector needs a step");
    return lookup(pair, NO_STEP);
}

const FieldVector& CorrectorStore::state(IndexPair pair, StepIndex step) const
{
    HOMOG_THROW_IF(!isTimeDependent(), InvalidArgumentException,
                   "CorrectorStore '" + name_ + "': static corrector has no time steps");
    return lookup(pair, step);
}

FieldVector CorrectorStore::extract(IndexPair pair, std::string_view primary_name) const
{
    return layout_.extract(state(pair), primary_name);
}

FieldVector CorrectorStore::extract(IndexPair pair, StepIndex step,
                                    std::string_view primary_name) const
{
    return layout_.extract(state(pair, step), primary_name);
}

// =============================================================================
// Helpers
// =============================================================================

std::size_t CorrectorStore::slot(IndexPair pair, StepIndex step) const
{
    if (!range_.contains(pair)) {
        throw UnknownIndexPairException("CorrectorStore '" + name_ + "': pair outside range",
                                        pair, step, __FILE__, __LINE__, __FUNCTION__);
    }
    if (isTimeDependent() && (step < 0 || step >= n_steps_)) {
        throw UnknownIndexPairException("CorrectorStore '" + name_ + "': step outside range",
                                        pair, step, __FILE__, __LINE__, __FUNCTION__);
    }

    const auto pair_index = static_cast<std::size_t>(pair.ir * range_.n_cols + pair.ic);
    if (!isTimeDependent()) {
        return pair_index;
    }
    return pair_index * static_cast<std::size_t>(n_steps_) + static_cast<std::size_t>(step);
}

const FieldVector& CorrectorStore::lookup(IndexPair pair, StepIndex step) const
{
    const auto k = slot(pair, step);
    if (!is_set_[k]) {
        throw UnknownIndexPairException("CorrectorStore '" + name_ + "': state was never set",
                                        pair, step, __FILE__, __LINE__, __FUNCTION__);
    }
    return states_[k];
}

} // namespace correctors
} // namespace Homog
} // namespace mshc
