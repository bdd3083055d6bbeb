// VALORIA - Oracle Error Codes Implementation
// Copyright (c) 2024 VALORIA Developers
// MIT License

#include "valoria/oracle/errors.h"

namespace valoria {
namespace oracle {

const char* OracleErrorToString(OracleError error) {
    switch (error) {
        case OracleError::None:                   return "NONE";
        case OracleError::NotOracle:              return "NOT_ORACLE";
        case OracleError::InvalidSubjectId:       return "INVALID_SUBJECT_ID";
        case OracleError::InvalidPrice:           return "INVALID_PRICE";
        case OracleError::InsufficientOracles:    return "INSUFFICIENT_ORACLES";
        case OracleError::ConsensusFailed:        return "CONSENSUS_FAILED";
        case OracleError::StaleData:              return "STALE_DATA";
        case OracleError::OracleNotApproved:      return "ORACLE_NOT_APPROVED";
        case OracleError::MaxOraclesExceeded:     return "MAX_ORACLES_EXCEEDED";
        case OracleError::InvalidWeight:          return "INVALID_WEIGHT";
        case OracleError::ValuationNotFound:      return "VALUATION_NOT_FOUND";
        case OracleError::InvalidTimestamp:       return "INVALID_TIMESTAMP";
        case OracleError::MaxSubmissionsExceeded: return "MAX_SUBMISSIONS_EXCEEDED";
        case OracleError::NotAuthorized:          return "NOT_AUTHORIZED";
        case OracleError::OracleAlreadyApproved:  return "ORACLE_ALREADY_APPROVED";
        case OracleError::InvalidThreshold:       return "INVALID_THRESHOLD";
        case OracleError::InvalidParameter:       return "INVALID_PARAMETER";
    }
    return "UNKNOWN";
}

} // namespace oracle
} // namespace valoria
