// VALORIA - Consensus Engine Implementation
// Copyright (c) 2024 VALORIA Developers
// MIT License

#include "valoria/oracle/engine.h"
#include "valoria/util/logging.h"
#include "valoria/util/time.h"

#include <algorithm>
#include <limits>
#include <stdexcept>

namespace valoria {
namespace oracle {

Price MedianPrice(const std::vector<WeightedSubmission>& submissions) {
    std::vector<Price> prices;
    prices.reserve(submissions.size());
    for (const auto& sub : submissions) {
        prices.push_back(sub.price);
    }
    std::sort(prices.begin(), prices.end());
    return prices[prices.size() / 2];
}

namespace {

constexpr int64_t kMaxCount = std::numeric_limits<uint32_t>::max();

template<typename T>
OracleResult<T> Reject(OracleError error, const char* operation) {
    LOG_DEBUG(util::LogCategory::ORACLE) << operation << " rejected: "
                                         << OracleErrorToString(error);
    return OracleResult<T>::Failure(error);
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

ConsensusEngine::ConsensusEngine(db::Database& db, const OracleParams& initialParams)
    : db_(db)
    , registry_(db)
    , ledger_(db)
    , valuations_(db) {
    auto stored = LoadParams(db_);
    if (stored) {
        params_ = *stored;
        if (params_ != initialParams) {
            LOG_INFO(util::LogCategory::CONFIG)
                << "Using stored parameters " << params_.ToString();
        }
        return;
    }

    std::string reason;
    if (!initialParams.IsValid(&reason)) {
        throw std::invalid_argument("invalid oracle parameters: " + reason);
    }

    SaveParams(db_, initialParams);
    params_ = initialParams;
    LOG_INFO(util::LogCategory::CONFIG) << "Initialised store with " << params_.ToString();
}

// ============================================================================
// Submissions
// ============================================================================

OracleResult<Price> ConsensusEngine::SubmitDataFeed(const Principal& caller,
                                                    SubjectId subject,
                                                    Price price,
                                                    const Principal& oracle) {
    std::lock_guard<std::mutex> lock(mutex_);
    const char* op = "submitDataFeed";

    if (caller != oracle) {
        return Reject<Price>(OracleError::NotOracle, op);
    }
    if (subject == 0) {
        return Reject<Price>(OracleError::InvalidSubjectId, op);
    }
    if (price <= 0) {
        return Reject<Price>(OracleError::InvalidPrice, op);
    }
    if (!registry_.IsApproved(oracle)) {
        return Reject<Price>(OracleError::OracleNotApproved, op);
    }

    const Timestamp now = util::GetTime();

    // The observation is stamped on arrival, so it is never older than the
    // window at this point.
    const Timestamp observed = now;
    if (now - observed > params_.stalenessWindow) {
        return Reject<Price>(OracleError::StaleData, op);
    }

    if (ledger_.ActivityOf(oracle).submissionCount >= params_.maxSubmissionsPerOracle) {
        return Reject<Price>(OracleError::MaxSubmissionsExceeded, op);
    }

    auto recorded = ledger_.RecordSubmission(subject, oracle, price, observed);
    if (!recorded) {
        return Reject<Price>(recorded.error, op);
    }

    OracleError consensus = RecomputeLocked(subject, now);
    if (consensus != OracleError::None) {
        LOG_DEBUG(util::LogCategory::CONSENSUS) << "Subject " << subject
                                                << " kept its valuation: "
                                                << OracleErrorToString(consensus);
        return OracleResult<Price>::Failure(consensus);
    }

    return OracleResult<Price>::Success(price);
}

OracleError ConsensusEngine::RecomputeLocked(SubjectId subject, Timestamp now) {
    const std::vector<WeightedSubmission> live = ledger_.SubmissionsFor(subject, registry_);

    if (live.size() < params_.consensusThreshold) {
        return OracleError::InsufficientOracles;
    }

    int64_t totalWeight = 0;
    for (const auto& sub : live) {
        totalWeight += sub.weight;
    }
    if (totalWeight < static_cast<int64_t>(params_.consensusThreshold)) {
        return OracleError::ConsensusFailed;
    }

    Valuation valuation;
    valuation.value = MedianPrice(live);
    valuation.timestamp = now;
    valuation.sourceCount = static_cast<uint32_t>(live.size());

    valuations_.Commit(subject, valuation);

    LOG_INFO(util::LogCategory::CONSENSUS) << "Subject " << subject << " valued at "
                                           << valuation.value << " from "
                                           << valuation.sourceCount << " sources (weight "
                                           << totalWeight << ")";

    for (const auto& listener : listeners_) {
        listener(subject, valuation);
    }
    return OracleError::None;
}

// ============================================================================
// Administration
// ============================================================================

OracleResult<bool> ConsensusEngine::AddOracle(const Principal& caller,
                                              const Principal& oracle,
                                              Weight weight) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto result = registry_.AddOracle(caller, oracle, weight, params_);
    if (!result) {
        return Reject<bool>(result.error, "addOracle");
    }
    return result;
}

OracleResult<bool> ConsensusEngine::RemoveOracle(const Principal& caller,
                                                 const Principal& oracle) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto result = registry_.RemoveOracle(caller, oracle, params_);
    if (!result) {
        return Reject<bool>(result.error, "removeOracle");
    }
    return result;
}

OracleResult<bool> ConsensusEngine::UpdateParamsLocked(
    const Principal& caller,
    const std::function<OracleError(OracleParams&)>& change,
    const char* what) {
    if (caller != params_.admin) {
        return Reject<bool>(OracleError::NotAuthorized, what);
    }

    OracleParams updated = params_;
    OracleError error = change(updated);
    if (error != OracleError::None) {
        return Reject<bool>(error, what);
    }

    SaveParams(db_, updated);
    params_ = updated;
    LOG_INFO(util::LogCategory::ORACLE) << what << ": " << params_.ToString();
    return OracleResult<bool>::Success(true);
}

OracleResult<bool> ConsensusEngine::SetConsensusThreshold(const Principal& caller, int64_t n) {
    std::lock_guard<std::mutex> lock(mutex_);
    return UpdateParamsLocked(caller, [n](OracleParams& p) {
        if (n < MIN_CONSENSUS_THRESHOLD || n > MAX_CONSENSUS_THRESHOLD) {
            return OracleError::InvalidThreshold;
        }
        p.consensusThreshold = static_cast<uint32_t>(n);
        return OracleError::None;
    }, "setConsensusThreshold");
}

OracleResult<bool> ConsensusEngine::SetMaxOracles(const Principal& caller, int64_t n) {
    std::lock_guard<std::mutex> lock(mutex_);
    return UpdateParamsLocked(caller, [this, n](OracleParams& p) {
        if (n < 1 || n > kMaxCount ||
            static_cast<size_t>(n) < registry_.Count()) {
            return OracleError::InvalidParameter;
        }
        p.maxOracles = static_cast<uint32_t>(n);
        return OracleError::None;
    }, "setMaxOracles");
}

OracleResult<bool> ConsensusEngine::SetMaxSubmissionsPerOracle(const Principal& caller, int64_t n) {
    std::lock_guard<std::mutex> lock(mutex_);
    return UpdateParamsLocked(caller, [n](OracleParams& p) {
        if (n < 1 || n > kMaxCount) {
            return OracleError::InvalidParameter;
        }
        p.maxSubmissionsPerOracle = static_cast<uint32_t>(n);
        return OracleError::None;
    }, "setMaxSubmissionsPerOracle");
}

OracleResult<bool> ConsensusEngine::SetStalenessWindow(const Principal& caller, int64_t seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    return UpdateParamsLocked(caller, [seconds](OracleParams& p) {
        if (seconds < 1 || seconds > MAX_STALENESS_WINDOW) {
            return OracleError::InvalidParameter;
        }
        p.stalenessWindow = seconds;
        return OracleError::None;
    }, "setStalenessWindow");
}

// ============================================================================
// Reads
// ============================================================================

std::optional<Valuation> ConsensusEngine::GetValuation(SubjectId subject) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return valuations_.Get(subject);
}

bool ConsensusEngine::IsOracleApproved(const Principal& oracle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return registry_.IsApproved(oracle);
}

std::optional<Weight> ConsensusEngine::GetOracleWeight(const Principal& oracle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return registry_.WeightOf(oracle);
}

std::optional<Submission> ConsensusEngine::GetSubmission(SubjectId subject,
                                                         const Principal& oracle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ledger_.GetSubmission(subject, oracle);
}

OracleActivity ConsensusEngine::GetOracleActivity(const Principal& oracle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ledger_.ActivityOf(oracle);
}

std::vector<OracleEntry> ConsensusEngine::GetApprovedOracles() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return registry_.GetApprovedOracles();
}

OracleParams ConsensusEngine::GetParams() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return params_;
}

void ConsensusEngine::OnValuationCommitted(ValuationCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_.push_back(std::move(callback));
}

} // namespace oracle
} // namespace valoria
