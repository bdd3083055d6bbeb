// VALORIA - Valuation Store
// Copyright (c) 2024 VALORIA Developers
// MIT License
//
// Published valuations, one per subject, under the 'v' prefix. This is the
// only artifact downstream consumers read.

#ifndef VALORIA_ORACLE_VALUATION_H
#define VALORIA_ORACLE_VALUATION_H

#include "valoria/core/serialize.h"
#include "valoria/core/types.h"
#include "valoria/db/database.h"

#include <optional>
#include <string>

namespace valoria {
namespace oracle {

/// Committed consensus value for a subject
struct Valuation {
    /// Median of the contributing prices
    Price value{0};

    /// When the valuation was computed
    Timestamp timestamp{0};

    /// Number of submissions that contributed
    uint32_t sourceCount{0};

    bool operator==(const Valuation& other) const {
        return value == other.value && timestamp == other.timestamp &&
               sourceCount == other.sourceCount;
    }
    bool operator!=(const Valuation& other) const { return !(*this == other); }

    std::string ToString() const;
};

template<typename Stream>
void Serialize(Stream& s, const Valuation& v) {
    ::valoria::Serialize(s, v.value);
    ::valoria::Serialize(s, v.timestamp);
    ::valoria::Serialize(s, v.sourceCount);
}

template<typename Stream>
void Unserialize(Stream& s, Valuation& v) {
    ::valoria::Unserialize(s, v.value);
    ::valoria::Unserialize(s, v.timestamp);
    ::valoria::Unserialize(s, v.sourceCount);
}

class ValuationStore {
public:
    explicit ValuationStore(db::Database& db);

    /// Current valuation of a subject; nullopt if none was ever committed
    std::optional<Valuation> Get(SubjectId subject) const;

    /// Replace the valuation of a subject (throws db::StorageError)
    void Commit(SubjectId subject, const Valuation& valuation);

private:
    db::Database& db_;
};

} // namespace oracle
} // namespace valoria

#endif // VALORIA_ORACLE_VALUATION_H
