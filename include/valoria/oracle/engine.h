// VALORIA - Consensus Engine
// Copyright (c) 2024 VALORIA Developers
// MIT License
//
// Single write entry point of the valuation system. A submission is
// validated against the registry and the ledger, recorded, and then every
// live submission for the subject is re-aggregated. When quorum and weight
// thresholds hold, the median price is committed as the subject's valuation.

#ifndef VALORIA_ORACLE_ENGINE_H
#define VALORIA_ORACLE_ENGINE_H

#include "valoria/core/types.h"
#include "valoria/db/database.h"
#include "valoria/oracle/errors.h"
#include "valoria/oracle/ledger.h"
#include "valoria/oracle/params.h"
#include "valoria/oracle/registry.h"
#include "valoria/oracle/valuation.h"

#include <functional>
#include <mutex>
#include <optional>
#include <vector>

namespace valoria {
namespace oracle {

/**
 * Aggregate prices into a valuation: sort ascending and take the element at
 * index n/2 (the upper median for even n).
 *
 * @param submissions Non-empty set of live submissions
 * @return Selected price
 */
Price MedianPrice(const std::vector<WeightedSubmission>& submissions);

/**
 * Validates, records and aggregates oracle submissions.
 *
 * One mutex serialises every operation, so the validate, record, recompute
 * and commit sequence never interleaves with another write or with changes
 * to the approved set. Domain failures are returned as OracleResult values;
 * storage failures propagate as db::StorageError.
 */
class ConsensusEngine {
public:
    /// Listener for committed valuations
    using ValuationCallback = std::function<void(SubjectId, const Valuation&)>;

    /**
     * Bind the engine to a store. A fresh store is initialised with
     * initialParams; a store that already holds parameters keeps them.
     *
     * @throws std::invalid_argument if a fresh store gets invalid parameters
     * @throws db::StorageError if the store cannot be read or written
     */
    ConsensusEngine(db::Database& db, const OracleParams& initialParams);

    ConsensusEngine(const ConsensusEngine&) = delete;
    ConsensusEngine& operator=(const ConsensusEngine&) = delete;

    // ========================================================================
    // Submissions
    // ========================================================================

    /**
     * Submit a price observation for a subject.
     *
     * Validation order: caller is the oracle (NotOracle), subject > 0
     * (InvalidSubjectId), price > 0 (InvalidPrice), oracle approved
     * (OracleNotApproved), observation within the staleness window
     * (StaleData), activity below the per-oracle quota
     * (MaxSubmissionsExceeded). A rejection here has no side effects.
     *
     * The submission is then recorded. If fewer than consensusThreshold
     * approved oracles have live submissions (InsufficientOracles), or their
     * summed weight is below consensusThreshold (ConsensusFailed), the
     * submission stays recorded and the valuation is left unchanged.
     *
     * @return The accepted price on success
     */
    OracleResult<Price> SubmitDataFeed(const Principal& caller, SubjectId subject,
                                       Price price, const Principal& oracle);

    // ========================================================================
    // Administration
    // ========================================================================

    OracleResult<bool> AddOracle(const Principal& caller, const Principal& oracle,
                                 Weight weight);

    OracleResult<bool> RemoveOracle(const Principal& caller, const Principal& oracle);

    /// Requires 1 <= n <= 10 (InvalidThreshold)
    OracleResult<bool> SetConsensusThreshold(const Principal& caller, int64_t n);

    /// Requires n >= 1 and n >= the current approved count (InvalidParameter)
    OracleResult<bool> SetMaxOracles(const Principal& caller, int64_t n);

    /// Requires n >= 1 (InvalidParameter)
    OracleResult<bool> SetMaxSubmissionsPerOracle(const Principal& caller, int64_t n);

    /// Requires seconds >= 1 (InvalidParameter)
    OracleResult<bool> SetStalenessWindow(const Principal& caller, int64_t seconds);

    // ========================================================================
    // Reads
    // ========================================================================

    std::optional<Valuation> GetValuation(SubjectId subject) const;
    bool IsOracleApproved(const Principal& oracle) const;
    std::optional<Weight> GetOracleWeight(const Principal& oracle) const;
    std::optional<Submission> GetSubmission(SubjectId subject, const Principal& oracle) const;
    OracleActivity GetOracleActivity(const Principal& oracle) const;
    std::vector<OracleEntry> GetApprovedOracles() const;
    OracleParams GetParams() const;

    // ========================================================================
    // Notifications
    // ========================================================================

    /**
     * Register a listener for committed valuations. Listeners run with the
     * engine lock held and must not call back into the engine.
     */
    void OnValuationCommitted(ValuationCallback callback);

private:
    db::Database& db_;
    OracleRegistry registry_;
    SubmissionLedger ledger_;
    ValuationStore valuations_;
    OracleParams params_;
    std::vector<ValuationCallback> listeners_;
    mutable std::mutex mutex_;

    /// Re-aggregate a subject and commit on success (mutex_ held)
    OracleError RecomputeLocked(SubjectId subject, Timestamp now);

    /// Apply a parameter change after the admin check (mutex_ held)
    OracleResult<bool> UpdateParamsLocked(const Principal& caller,
                                          const std::function<OracleError(OracleParams&)>& change,
                                          const char* what);
};

} // namespace oracle
} // namespace valoria

#endif // VALORIA_ORACLE_ENGINE_H
