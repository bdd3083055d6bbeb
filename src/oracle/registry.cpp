// VALORIA - Oracle Registry Implementation
// Copyright (c) 2024 VALORIA Developers
// MIT License

#include "valoria/oracle/registry.h"
#include "valoria/util/logging.h"

namespace valoria {
namespace oracle {

OracleRegistry::OracleRegistry(db::Database& db) : db_(db) {}

std::string OracleRegistry::KeyFor(const Principal& oracle) {
    return db::MakeKey(db::prefix::ORACLE, oracle);
}

// ============================================================================
// Administration
// ============================================================================

OracleResult<bool> OracleRegistry::AddOracle(const Principal& caller,
                                             const Principal& oracle,
                                             Weight weight,
                                             const OracleParams& params) {
    if (caller != params.admin) {
        return OracleResult<bool>::Failure(OracleError::NotAuthorized);
    }
    if (IsApproved(oracle)) {
        return OracleResult<bool>::Failure(OracleError::OracleAlreadyApproved);
    }
    if (!WeightRange(weight)) {
        return OracleResult<bool>::Failure(OracleError::InvalidWeight);
    }
    if (Count() >= params.maxOracles) {
        return OracleResult<bool>::Failure(OracleError::MaxOraclesExceeded);
    }

    db::Status status = db_.Put(KeyFor(oracle), db::SerializeToString(weight));
    if (!status.ok()) {
        LOG_ERROR(util::LogCategory::DB) << "Failed to store oracle " << oracle
                                         << ": " << status.ToString();
        throw db::StorageError(status);
    }

    LOG_INFO(util::LogCategory::ORACLE) << "Approved oracle " << oracle
                                        << " with weight " << weight;
    return OracleResult<bool>::Success(true);
}

OracleResult<bool> OracleRegistry::RemoveOracle(const Principal& caller,
                                                const Principal& oracle,
                                                const OracleParams& params) {
    if (caller != params.admin) {
        return OracleResult<bool>::Failure(OracleError::NotAuthorized);
    }
    if (!IsApproved(oracle)) {
        return OracleResult<bool>::Failure(OracleError::OracleNotApproved);
    }

    db::Status status = db_.Delete(KeyFor(oracle));
    if (!status.ok()) {
        LOG_ERROR(util::LogCategory::DB) << "Failed to remove oracle " << oracle
                                         << ": " << status.ToString();
        throw db::StorageError(status);
    }

    LOG_INFO(util::LogCategory::ORACLE) << "Removed oracle " << oracle;
    return OracleResult<bool>::Success(true);
}

// ============================================================================
// Lookup
// ============================================================================

bool OracleRegistry::IsApproved(const Principal& oracle) const {
    return WeightOf(oracle).has_value();
}

std::optional<Weight> OracleRegistry::WeightOf(const Principal& oracle) const {
    std::string data;
    db::Status status = db_.Get(KeyFor(oracle), &data);
    if (status.IsNotFound()) {
        return std::nullopt;
    }
    if (!status.ok()) {
        throw db::StorageError(status);
    }

    Weight weight = 0;
    if (!db::DeserializeFromString(data, weight) || !WeightRange(weight)) {
        LOG_ERROR(util::LogCategory::DB) << "Unreadable weight record for oracle " << oracle;
        return std::nullopt;
    }
    return weight;
}

size_t OracleRegistry::Count() const {
    return GetApprovedOracles().size();
}

std::vector<OracleEntry> OracleRegistry::GetApprovedOracles() const {
    std::vector<OracleEntry> result;

    db::ForEachWithPrefix(db_, db::MakeKey(db::prefix::ORACLE),
        [&result](const db::Slice& key, const db::Slice& value) {
            OracleEntry entry;
            // Skip the prefix byte; the rest is the serialized principal
            const std::string keyData(key.data() + 1, key.size() - 1);
            if (!db::DeserializeFromString(keyData, entry.oracle) ||
                !db::DeserializeFromString(value.ToString(), entry.weight) ||
                !WeightRange(entry.weight)) {
                LOG_ERROR(util::LogCategory::DB) << "Skipping unreadable oracle record";
                return true;
            }
            result.push_back(std::move(entry));
            return true;
        });

    return result;
}

} // namespace oracle
} // namespace valoria
