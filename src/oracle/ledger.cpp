// VALORIA - Submission Ledger Implementation
// Copyright (c) 2024 VALORIA Developers
// MIT License

#include "valoria/oracle/ledger.h"
#include "valoria/oracle/registry.h"
#include "valoria/util/logging.h"

namespace valoria {
namespace oracle {

SubmissionLedger::SubmissionLedger(db::Database& db) : db_(db) {}

std::string SubmissionLedger::SubmissionKey(SubjectId subject, const Principal& oracle) {
    return db::MakeKey(db::prefix::SUBMISSION, subject, oracle);
}

std::string SubmissionLedger::ActivityKey(const Principal& oracle) {
    return db::MakeKey(db::prefix::ACTIVITY, oracle);
}

OracleResult<OracleActivity> SubmissionLedger::RecordSubmission(SubjectId subject,
                                                                const Principal& oracle,
                                                                Price price,
                                                                Timestamp now) {
    if (price <= 0) {
        return OracleResult<OracleActivity>::Failure(OracleError::InvalidPrice);
    }

    OracleActivity activity = ActivityOf(oracle);
    ++activity.submissionCount;
    activity.lastActive = now;

    Submission submission;
    submission.price = price;
    submission.timestamp = now;

    db::WriteBatch batch;
    batch.Put(SubmissionKey(subject, oracle), db::SerializeToString(submission));
    batch.Put(ActivityKey(oracle), db::SerializeToString(activity));

    db::Status status = db_.Write(&batch);
    if (!status.ok()) {
        LOG_ERROR(util::LogCategory::DB) << "Failed to record submission from " << oracle
                                         << " for subject " << subject << ": "
                                         << status.ToString();
        throw db::StorageError(status);
    }

    LOG_DEBUG(util::LogCategory::LEDGER) << "Recorded " << price << " from " << oracle
                                         << " for subject " << subject << " ("
                                         << activity.submissionCount << " submissions)";
    return OracleResult<OracleActivity>::Success(activity);
}

std::vector<WeightedSubmission> SubmissionLedger::SubmissionsFor(
    SubjectId subject, const OracleRegistry& registry) const {
    std::vector<WeightedSubmission> result;

    // 's' || subject; the oracle principal follows in each key
    const std::string subjectPrefix = db::MakeKey(db::prefix::SUBMISSION, subject);

    db::ForEachWithPrefix(db_, subjectPrefix,
        [&](const db::Slice& key, const db::Slice& value) {
            WeightedSubmission entry;
            const std::string oracleData(key.data() + subjectPrefix.size(),
                                         key.size() - subjectPrefix.size());
            Submission submission;
            if (!db::DeserializeFromString(oracleData, entry.oracle) ||
                !db::DeserializeFromString(value.ToString(), submission)) {
                LOG_ERROR(util::LogCategory::DB) << "Skipping unreadable submission for subject "
                                                 << subject;
                return true;
            }

            auto weight = registry.WeightOf(entry.oracle);
            if (!weight) {
                return true;
            }

            entry.price = submission.price;
            entry.timestamp = submission.timestamp;
            entry.weight = *weight;
            result.push_back(std::move(entry));
            return true;
        });

    return result;
}

std::optional<Submission> SubmissionLedger::GetSubmission(SubjectId subject,
                                                          const Principal& oracle) const {
    std::string data;
    db::Status status = db_.Get(SubmissionKey(subject, oracle), &data);
    if (status.IsNotFound()) {
        return std::nullopt;
    }
    if (!status.ok()) {
        throw db::StorageError(status);
    }

    Submission submission;
    if (!db::DeserializeFromString(data, submission)) {
        LOG_ERROR(util::LogCategory::DB) << "Unreadable submission record for subject "
                                         << subject << " from " << oracle;
        return std::nullopt;
    }
    return submission;
}

OracleActivity SubmissionLedger::ActivityOf(const Principal& oracle) const {
    std::string data;
    db::Status status = db_.Get(ActivityKey(oracle), &data);
    if (status.IsNotFound()) {
        return OracleActivity{};
    }
    if (!status.ok()) {
        throw db::StorageError(status);
    }

    OracleActivity activity;
    if (!db::DeserializeFromString(data, activity)) {
        LOG_ERROR(util::LogCategory::DB) << "Unreadable activity record for " << oracle;
        return OracleActivity{};
    }
    return activity;
}

} // namespace oracle
} // namespace valoria
