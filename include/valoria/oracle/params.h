// VALORIA - Oracle Parameters
// Copyright (c) 2024 VALORIA Developers
// MIT License
//
// Process-wide, admin-mutable parameters of the valuation engine. They are
// seeded from configuration when a data directory is first created and
// persisted under the 'P' key from then on.

#ifndef VALORIA_ORACLE_PARAMS_H
#define VALORIA_ORACLE_PARAMS_H

#include "valoria/core/serialize.h"
#include "valoria/core/types.h"
#include "valoria/db/database.h"
#include "valoria/util/config.h"

#include <cstdint>
#include <ios>
#include <optional>
#include <string>

namespace valoria {
namespace oracle {

// ============================================================================
// Defaults
// ============================================================================

constexpr uint32_t DEFAULT_MAX_ORACLES = 10;
constexpr uint32_t DEFAULT_CONSENSUS_THRESHOLD = 3;
constexpr uint32_t DEFAULT_MAX_SUBMISSIONS_PER_ORACLE = 5;
constexpr int64_t DEFAULT_STALENESS_WINDOW = 3600;  // seconds
constexpr int64_t MAX_STALENESS_WINDOW = 365 * 86400;

/// On-disk format version of OracleParams
constexpr uint8_t PARAMS_VERSION = 1;

// ============================================================================
// OracleParams
// ============================================================================

struct OracleParams {
    /// Capacity of the approved oracle set
    uint32_t maxOracles{DEFAULT_MAX_ORACLES};

    /// Minimum live submissions, and minimum summed weight, for consensus
    uint32_t consensusThreshold{DEFAULT_CONSENSUS_THRESHOLD};

    /// Lifetime submission quota per oracle, across all subjects
    uint32_t maxSubmissionsPerOracle{DEFAULT_MAX_SUBMISSIONS_PER_ORACLE};

    /// Maximum age of an observation, in seconds
    int64_t stalenessWindow{DEFAULT_STALENESS_WINDOW};

    /// The single administrative identity
    Principal admin;

    bool operator==(const OracleParams& other) const {
        return maxOracles == other.maxOracles &&
               consensusThreshold == other.consensusThreshold &&
               maxSubmissionsPerOracle == other.maxSubmissionsPerOracle &&
               stalenessWindow == other.stalenessWindow &&
               admin == other.admin;
    }
    bool operator!=(const OracleParams& other) const { return !(*this == other); }

    /// Check every field against its accepted range
    bool IsValid(std::string* reason = nullptr) const;

    std::string ToString() const;
};

template<typename Stream>
void Serialize(Stream& s, const OracleParams& p) {
    ::valoria::Serialize(s, PARAMS_VERSION);
    ::valoria::Serialize(s, p.maxOracles);
    ::valoria::Serialize(s, p.consensusThreshold);
    ::valoria::Serialize(s, p.maxSubmissionsPerOracle);
    ::valoria::Serialize(s, p.stalenessWindow);
    ::valoria::Serialize(s, p.admin);
}

template<typename Stream>
void Unserialize(Stream& s, OracleParams& p) {
    uint8_t version = 0;
    ::valoria::Unserialize(s, version);
    if (version != PARAMS_VERSION) {
        throw std::ios_base::failure("OracleParams: unsupported version");
    }
    ::valoria::Unserialize(s, p.maxOracles);
    ::valoria::Unserialize(s, p.consensusThreshold);
    ::valoria::Unserialize(s, p.maxSubmissionsPerOracle);
    ::valoria::Unserialize(s, p.stalenessWindow);
    ::valoria::Unserialize(s, p.admin);
}

// ============================================================================
// Configuration and Persistence
// ============================================================================

/**
 * Build parameters from configuration. Missing keys take the defaults;
 * the admin key is required.
 *
 * @param config Parsed configuration
 * @param out Receives the parameters on success
 * @return Error describing the first invalid key, or Success()
 */
util::ConfigParseResult ParamsFromConfig(const util::ConfigManager& config,
                                         OracleParams& out);

/// Load persisted parameters; nullopt for a fresh store
std::optional<OracleParams> LoadParams(db::Database& db);

/// Persist parameters (throws db::StorageError on failure)
void SaveParams(db::Database& db, const OracleParams& params);

} // namespace oracle
} // namespace valoria

#endif // VALORIA_ORACLE_PARAMS_H
