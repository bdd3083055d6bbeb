// VALORIA - Valuation Store Implementation
// Copyright (c) 2024 VALORIA Developers
// MIT License

#include "valoria/oracle/valuation.h"
#include "valoria/util/logging.h"

#include <sstream>

namespace valoria {
namespace oracle {

std::string Valuation::ToString() const {
    std::ostringstream oss;
    oss << "Valuation(value=" << value << ", timestamp=" << timestamp
        << ", sources=" << sourceCount << ")";
    return oss.str();
}

ValuationStore::ValuationStore(db::Database& db) : db_(db) {}

std::optional<Valuation> ValuationStore::Get(SubjectId subject) const {
    std::string data;
    db::Status status = db_.Get(db::MakeKey(db::prefix::VALUATION, subject), &data);
    if (status.IsNotFound()) {
        return std::nullopt;
    }
    if (!status.ok()) {
        throw db::StorageError(status);
    }

    Valuation valuation;
    if (!db::DeserializeFromString(data, valuation)) {
        LOG_ERROR(util::LogCategory::DB) << "Unreadable valuation record for subject " << subject;
        return std::nullopt;
    }
    return valuation;
}

void ValuationStore::Commit(SubjectId subject, const Valuation& valuation) {
    db::Status status = db_.Put(db::MakeKey(db::prefix::VALUATION, subject),
                                db::SerializeToString(valuation));
    if (!status.ok()) {
        LOG_ERROR(util::LogCategory::DB) << "Failed to commit valuation for subject "
                                         << subject << ": " << status.ToString();
        throw db::StorageError(status);
    }
}

} // namespace oracle
} // namespace valoria
