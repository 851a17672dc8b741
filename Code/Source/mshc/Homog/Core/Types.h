/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#ifndef MSHC_HOMOG_TYPES_H
#define MSHC_HOMOG_TYPES_H

/**
 * @file Types.h
 * @brief Fundamental type definitions for the homogenization library
 *
 * Core aliases for scalars, DOF offsets and macroscopic tensor indices, the
 * index pair used to address corrector states and coefficient entries, and
 * the status codes carried by every library exception.
 */

#include <Eigen/Dense>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <string>

namespace mshc {
namespace Homog {

// ============================================================================
// Scalar and Index Types
// ============================================================================

using Real = double;

/**
 * @brief Offset into a concatenated state vector
 *
 * Signed 64-bit so that negative values can mark invalid offsets.
 */
using GlobalIndex = std::int64_t;

/**
 * @brief Macroscopic tensor index (ir, ic, or a symmetric-storage index)
 */
using TensorIndex = int;

/**
 * @brief Time step index of a time-dependent corrector
 */
using StepIndex = int;

/**
 * @brief Nodal field values of one variable (node-major, components interleaved)
 */
using FieldVector = Eigen::VectorXd;

/**
 * @brief Dense homogenized tensor storage
 */
using DenseTensor = Eigen::MatrixXd;

constexpr GlobalIndex INVALID_GLOBAL_INDEX = -1;
constexpr StepIndex NO_STEP = -1;

// ============================================================================
// Index Pair
// ============================================================================

/**
 * @brief Pair of macroscopic tensor indices identifying one tensor entry
 */
struct IndexPair {
    TensorIndex ir{0};
    TensorIndex ic{0};

    constexpr IndexPair() noexcept = default;
    constexpr IndexPair(TensorIndex r, TensorIndex c) noexcept : ir(r), ic(c) {}

    [[nodiscard]] constexpr IndexPair transposed() const noexcept { return {ic, ir}; }

    constexpr bool operator==(const IndexPair& other) const noexcept {
        return ir == other.ir && ic == other.ic;
    }
    constexpr bool operator!=(const IndexPair& other) const noexcept {
        return !(*this == other);
    }
    constexpr bool operator<(const IndexPair& other) const noexcept {
        return ir < other.ir || (ir == other.ir && ic < other.ic);
    }
};

inline std::string to_string(const IndexPair& pair) {
    return "(" + std::to_string(pair.ir) + ", " + std::to_string(pair.ic) + ")";
}

struct IndexPairHash {
    std::size_t operator()(const IndexPair& pair) const noexcept {
        const auto r = static_cast<std::uint64_t>(static_cast<std::uint32_t>(pair.ir));
        const auto c = static_cast<std::uint64_t>(static_cast<std::uint32_t>(pair.ic));
        return std::hash<std::uint64_t>{}((r << 32) | c);
    }
};

// ============================================================================
// Coefficient Classes
// ============================================================================

/**
 * @brief Index-symmetry class of a homogenized coefficient
 *
 * SymSym      rank-4 tensor with minor and major symmetry, sym x sym storage
 * Sym         symmetric rank-2 tensor stored as a sym vector
 * DimDim      shape-pair quantity over the full dim x dim index range
 * TimeSeries  SymSym tensor evaluated for every corrector time step
 */
enum class CoefficientClass : std::uint8_t {
    SymSym,
    Sym,
    DimDim,
    TimeSeries
};

inline const char* coefficient_class_to_string(CoefficientClass kind) noexcept {
    switch (kind) {
        case CoefficientClass::SymSym:     return "SymSym";
        case CoefficientClass::Sym:        return "Sym";
        case CoefficientClass::DimDim:     return "DimDim";
        case CoefficientClass::TimeSeries: return "TimeSeries";
        default:                           return "Unknown";
    }
}

// ============================================================================
// Status Codes
// ============================================================================

/**
 * @brief Status codes for homogenization operations
 */
enum class HomogStatus : std::uint8_t {
    Success            = 0,
    InvalidArgument    = 1,
    MissingDependency  = 2,
    UnknownIndexPair   = 3,
    VariableLookup     = 4,
    DependencyCycle    = 5,
    AssemblyError      = 6,
    NotImplemented     = 7,
    Unknown            = 255
};

/**
 * @brief Convert status code to string for error reporting
 */
inline const char* status_to_string(HomogStatus status) noexcept {
    switch (status) {
        case HomogStatus::Success:           return "Success";
        case HomogStatus::InvalidArgument:   return "Invalid argument";
        case HomogStatus::MissingDependency: return "Missing dependency";
        case HomogStatus::UnknownIndexPair:  return "Unknown index pair";
        case HomogStatus::VariableLookup:    return "Variable lookup error";
        case HomogStatus::DependencyCycle:   return "Dependency cycle";
        case HomogStatus::AssemblyError:     return "Assembly error";
        case HomogStatus::NotImplemented:    return "Not implemented";
        default:                             return "Unknown error";
    }
}

} // namespace Homog
} // namespace mshc

#endif // MSHC_HOMOG_TYPES_H
