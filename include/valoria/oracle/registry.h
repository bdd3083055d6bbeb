// VALORIA - Oracle Registry
// Copyright (c) 2024 VALORIA Developers
// MIT License
//
// The set of approved oracles and their trust weights. Records live under
// the 'o' prefix: oracle -> weight. An oracle without a record is not
// approved and has no weight.

#ifndef VALORIA_ORACLE_REGISTRY_H
#define VALORIA_ORACLE_REGISTRY_H

#include "valoria/core/types.h"
#include "valoria/db/database.h"
#include "valoria/oracle/errors.h"
#include "valoria/oracle/params.h"

#include <optional>
#include <string>
#include <vector>

namespace valoria {
namespace oracle {

/// An approved oracle and its weight
struct OracleEntry {
    Principal oracle;
    Weight weight{0};

    bool operator==(const OracleEntry& other) const {
        return oracle == other.oracle && weight == other.weight;
    }
};

/**
 * Admission control over who may submit observations.
 *
 * The registry is a view over the database; it holds no state of its own
 * and is not internally synchronised. ConsensusEngine serialises access.
 * Storage failures are raised as db::StorageError.
 */
class OracleRegistry {
public:
    explicit OracleRegistry(db::Database& db);

    // ========================================================================
    // Administration
    // ========================================================================

    /**
     * Approve an oracle with a weight.
     *
     * Checks, in order: caller is params.admin (NotAuthorized), oracle is not
     * yet approved (OracleAlreadyApproved), weight in [1, 100]
     * (InvalidWeight), approved count below params.maxOracles
     * (MaxOraclesExceeded).
     */
    OracleResult<bool> AddOracle(const Principal& caller, const Principal& oracle,
                                 Weight weight, const OracleParams& params);

    /**
     * Revoke an approval and its weight. Submissions the oracle made are
     * kept; they stop counting because lookups filter on approval.
     */
    OracleResult<bool> RemoveOracle(const Principal& caller, const Principal& oracle,
                                    const OracleParams& params);

    // ========================================================================
    // Lookup
    // ========================================================================

    bool IsApproved(const Principal& oracle) const;

    /// Weight of an approved oracle; nullopt when not approved
    std::optional<Weight> WeightOf(const Principal& oracle) const;

    /// Number of approved oracles
    size_t Count() const;

    /// All approved oracles in key order
    std::vector<OracleEntry> GetApprovedOracles() const;

private:
    db::Database& db_;

    static std::string KeyFor(const Principal& oracle);
};

} // namespace oracle
} // namespace valoria

#endif // VALORIA_ORACLE_REGISTRY_H
