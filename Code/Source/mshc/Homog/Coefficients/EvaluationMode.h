/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#ifndef MSHC_HOMOG_COEFFICIENTS_EVALUATIONMODE_H
#define MSHC_HOMOG_COEFFICIENTS_EVALUATIONMODE_H

#include <cstdint>
#include <string_view>

namespace mshc {
namespace Homog {
namespace coefs {

/**
 * @brief Which side of a symmetric bilinear form a substitution feeds
 *
 * Row and Col split a symmetric evaluation into its test and trial halves.
 * All requests every substitution at once and is only valid for classes
 * that do not split (DimDim).
 */
enum class EvaluationMode : std::uint8_t {
    Row,
    Col,
    All
};

inline const char* evaluation_mode_to_string(EvaluationMode mode) noexcept {
    switch (mode) {
        case EvaluationMode::Row: return "row";
        case EvaluationMode::Col: return "col";
        case EvaluationMode::All: return "all";
        default:                  return "unknown";
    }
}

/**
 * @brief Parse "row" or "col"
 * @throws VariableLookupException for any other string
 */
[[nodiscard]] EvaluationMode parseEvaluationMode(std::string_view mode);

} // namespace coefs
} // namespace Homog
} // namespace mshc

#endif // MSHC_HOMOG_COEFFICIENTS_EVALUATIONMODE_H
