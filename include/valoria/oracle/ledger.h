// VALORIA - Submission Ledger
// Copyright (c) 2024 VALORIA Developers
// MIT License
//
// Latest observation per (subject, oracle) pair and per-oracle activity
// counters used for rate limiting.
//
// Storage layout:
//   's' || subject || oracle -> Submission
//   'a' || oracle            -> OracleActivity

#ifndef VALORIA_ORACLE_LEDGER_H
#define VALORIA_ORACLE_LEDGER_H

#include "valoria/core/serialize.h"
#include "valoria/core/types.h"
#include "valoria/db/database.h"
#include "valoria/oracle/errors.h"

#include <optional>
#include <string>
#include <vector>

namespace valoria {
namespace oracle {

class OracleRegistry;

// ============================================================================
// Records
// ============================================================================

/// One oracle's current observation for one subject
struct Submission {
    Price price{0};
    Timestamp timestamp{0};

    bool operator==(const Submission& other) const {
        return price == other.price && timestamp == other.timestamp;
    }
};

template<typename Stream>
void Serialize(Stream& s, const Submission& sub) {
    ::valoria::Serialize(s, sub.price);
    ::valoria::Serialize(s, sub.timestamp);
}

template<typename Stream>
void Unserialize(Stream& s, Submission& sub) {
    ::valoria::Unserialize(s, sub.price);
    ::valoria::Unserialize(s, sub.timestamp);
}

/// Lifetime submission counter of an oracle, across all subjects
struct OracleActivity {
    uint32_t submissionCount{0};
    Timestamp lastActive{0};
};

template<typename Stream>
void Serialize(Stream& s, const OracleActivity& act) {
    ::valoria::Serialize(s, act.submissionCount);
    ::valoria::Serialize(s, act.lastActive);
}

template<typename Stream>
void Unserialize(Stream& s, OracleActivity& act) {
    ::valoria::Unserialize(s, act.submissionCount);
    ::valoria::Unserialize(s, act.lastActive);
}

/// A live submission together with its oracle's current weight
struct WeightedSubmission {
    Principal oracle;
    Price price{0};
    Timestamp timestamp{0};
    Weight weight{0};
};

// ============================================================================
// SubmissionLedger
// ============================================================================

/**
 * Submission records and activity counters. Like OracleRegistry this is a
 * view over the database without internal locking.
 */
class SubmissionLedger {
public:
    explicit SubmissionLedger(db::Database& db);

    /**
     * Store {price, now} in the (subject, oracle) slot, replacing any earlier
     * observation, and bump the oracle's activity counter. Both records are
     * written in one atomic batch.
     *
     * @return The updated activity counter, or InvalidPrice for price <= 0
     */
    OracleResult<OracleActivity> RecordSubmission(SubjectId subject, const Principal& oracle,
                                                  Price price, Timestamp now);

    /**
     * Live submissions for a subject from oracles approved at the time of
     * the call, each with its oracle's weight.
     */
    std::vector<WeightedSubmission> SubmissionsFor(SubjectId subject,
                                                   const OracleRegistry& registry) const;

    /// Raw (subject, oracle) record, regardless of approval
    std::optional<Submission> GetSubmission(SubjectId subject, const Principal& oracle) const;

    /// Activity counter of an oracle (zero if it never submitted)
    OracleActivity ActivityOf(const Principal& oracle) const;

private:
    db::Database& db_;

    static std::string SubmissionKey(SubjectId subject, const Principal& oracle);
    static std::string ActivityKey(const Principal& oracle);
};

} // namespace oracle
} // namespace valoria

#endif // VALORIA_ORACLE_LEDGER_H
