// VALORIA - Core Types Header
// Copyright (c) 2024 VALORIA Developers
// MIT License
//
// This file defines fundamental types used throughout VALORIA.

#ifndef VALORIA_CORE_TYPES_H
#define VALORIA_CORE_TYPES_H

#include <cstdint>
#include <cstddef>
#include <string>

namespace valoria {

// ============================================================================
// Basic Types
// ============================================================================

/// Timestamp (Unix epoch seconds, or logical clock ticks)
using Timestamp = int64_t;

/// Observed or aggregated price in the smallest quoted unit
using Price = int64_t;

/// Identifier of a valued subject (a property)
using SubjectId = uint64_t;

/// Oracle trust weight
using Weight = int32_t;

/// Verified caller identity. Authentication happens before a principal
/// reaches this code base, so it is treated as an opaque, unforgeable string.
using Principal = std::string;

// ============================================================================
// Domain Limits
// ============================================================================

/// Smallest weight an oracle may be approved with
constexpr Weight MIN_ORACLE_WEIGHT = 1;

/// Largest weight an oracle may be approved with
constexpr Weight MAX_ORACLE_WEIGHT = 100;

/// Smallest accepted consensus threshold
constexpr int MIN_CONSENSUS_THRESHOLD = 1;

/// Largest accepted consensus threshold
constexpr int MAX_CONSENSUS_THRESHOLD = 10;

/// Check if a weight is inside the accepted range
inline bool WeightRange(Weight weight) {
    return weight >= MIN_ORACLE_WEIGHT && weight <= MAX_ORACLE_WEIGHT;
}

} // namespace valoria

#endif // VALORIA_CORE_TYPES_H
