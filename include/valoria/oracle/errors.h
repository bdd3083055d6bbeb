// VALORIA - Oracle Error Codes
// Copyright (c) 2024 VALORIA Developers
// MIT License
//
// Domain failures of the valuation engine. Numbers are stable and form part
// of the external interface.

#ifndef VALORIA_ORACLE_ERRORS_H
#define VALORIA_ORACLE_ERRORS_H

#include <cstdint>
#include <utility>

namespace valoria {
namespace oracle {

// ============================================================================
// Error Codes
// ============================================================================

enum class OracleError : uint32_t {
    None = 0,

    NotOracle = 100,                ///< Caller is not the oracle it submits for
    InvalidSubjectId = 101,
    InvalidPrice = 102,
    InsufficientOracles = 103,      ///< Fewer live submissions than the threshold
    ConsensusFailed = 104,          ///< Contributing weight below the threshold
    StaleData = 105,
    OracleNotApproved = 106,
    MaxOraclesExceeded = 107,
    InvalidWeight = 108,
    ValuationNotFound = 109,
    InvalidTimestamp = 110,         ///< Reserved, never produced by the engine
    MaxSubmissionsExceeded = 111,
    NotAuthorized = 112,            ///< Caller is not the administrator
    OracleAlreadyApproved = 113,
    InvalidThreshold = 114,
    InvalidParameter = 115,
};

/// Upper-case name of an error (e.g. "INVALID_WEIGHT")
const char* OracleErrorToString(OracleError error);

/// Numeric code of an error
inline uint32_t OracleErrorCode(OracleError error) {
    return static_cast<uint32_t>(error);
}

// ============================================================================
// Operation Result
// ============================================================================

/**
 * Outcome of an engine operation: a value on success, an error code on
 * failure. A failed result never carries a meaningful value.
 */
template<typename T>
struct OracleResult {
    bool ok{false};
    T value{};
    OracleError error{OracleError::None};

    static OracleResult Success(T v) {
        OracleResult r;
        r.ok = true;
        r.value = std::move(v);
        return r;
    }

    static OracleResult Failure(OracleError e) {
        OracleResult r;
        r.error = e;
        return r;
    }

    bool IsOk() const { return ok; }
    explicit operator bool() const { return ok; }
};

} // namespace oracle
} // namespace valoria

#endif // VALORIA_ORACLE_ERRORS_H
