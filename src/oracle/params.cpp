// VALORIA - Oracle Parameters Implementation
// Copyright (c) 2024 VALORIA Developers
// MIT License

#include "valoria/oracle/params.h"
#include "valoria/util/logging.h"

#include <limits>
#include <sstream>

namespace valoria {
namespace oracle {

std::string OracleParams::ToString() const {
    std::ostringstream oss;
    oss << "OracleParams(admin=" << admin
        << ", maxOracles=" << maxOracles
        << ", consensusThreshold=" << consensusThreshold
        << ", maxSubmissionsPerOracle=" << maxSubmissionsPerOracle
        << ", stalenessWindow=" << stalenessWindow << "s)";
    return oss.str();
}

bool OracleParams::IsValid(std::string* reason) const {
    const char* problem = nullptr;
    if (admin.empty()) {
        problem = "admin identity is empty";
    } else if (maxOracles < 1) {
        problem = "maxOracles must be at least 1";
    } else if (consensusThreshold < static_cast<uint32_t>(MIN_CONSENSUS_THRESHOLD) ||
               consensusThreshold > static_cast<uint32_t>(MAX_CONSENSUS_THRESHOLD)) {
        problem = "consensusThreshold must be between 1 and 10";
    } else if (maxSubmissionsPerOracle < 1) {
        problem = "maxSubmissionsPerOracle must be at least 1";
    } else if (stalenessWindow < 1 || stalenessWindow > MAX_STALENESS_WINDOW) {
        problem = "stalenessWindow must be between 1 second and 365 days";
    }

    if (problem && reason) {
        *reason = problem;
    }
    return problem == nullptr;
}

namespace {

/// Read an integer key bounded to [minValue, maxValue]
bool ReadBounded(const util::ConfigManager& config, const char* key,
                 int64_t minValue, int64_t maxValue, int64_t& value,
                 util::ConfigParseResult& result) {
    if (!config.HasKey(key)) {
        return true;
    }

    auto parsed = config.TryGetInt(key);
    if (!parsed) {
        result = util::ConfigParseResult::Error(
            std::string(key) + ": not an integer: " + config.GetString(key, ""));
        return false;
    }
    if (*parsed < minValue || *parsed > maxValue) {
        result = util::ConfigParseResult::Error(
            std::string(key) + ": out of range [" + std::to_string(minValue) + ", " +
            std::to_string(maxValue) + "]: " + std::to_string(*parsed));
        return false;
    }
    value = *parsed;
    return true;
}

} // namespace

util::ConfigParseResult ParamsFromConfig(const util::ConfigManager& config,
                                         OracleParams& out) {
    namespace keys = util::ConfigKeys;

    util::ConfigParseResult result = util::ConfigParseResult::Success();
    OracleParams params;

    params.admin = config.GetString(keys::ADMIN, "");
    if (params.admin.empty()) {
        return util::ConfigParseResult::Error(std::string(keys::ADMIN) + " is required");
    }

    constexpr int64_t u32max = std::numeric_limits<uint32_t>::max();

    int64_t maxOracles = params.maxOracles;
    int64_t threshold = params.consensusThreshold;
    int64_t maxSubmissions = params.maxSubmissionsPerOracle;
    int64_t staleness = params.stalenessWindow;

    if (!ReadBounded(config, keys::MAXORACLES, 1, u32max, maxOracles, result) ||
        !ReadBounded(config, keys::CONSENSUSTHRESHOLD, MIN_CONSENSUS_THRESHOLD,
                     MAX_CONSENSUS_THRESHOLD, threshold, result) ||
        !ReadBounded(config, keys::MAXSUBMISSIONS, 1, u32max, maxSubmissions, result) ||
        !ReadBounded(config, keys::STALENESSWINDOW, 1, MAX_STALENESS_WINDOW,
                     staleness, result)) {
        return result;
    }

    params.maxOracles = static_cast<uint32_t>(maxOracles);
    params.consensusThreshold = static_cast<uint32_t>(threshold);
    params.maxSubmissionsPerOracle = static_cast<uint32_t>(maxSubmissions);
    params.stalenessWindow = staleness;

    out = params;
    return result;
}

std::optional<OracleParams> LoadParams(db::Database& db) {
    std::string data;
    db::Status status = db.Get(db::MakeKey(db::prefix::PARAMS), &data);
    if (status.IsNotFound()) {
        return std::nullopt;
    }
    if (!status.ok()) {
        throw db::StorageError(status);
    }

    OracleParams params;
    if (!db::DeserializeFromString(data, params)) {
        // Unlike other records, parameters have no usable "absent" value
        throw db::StorageError(db::Status::Corruption("unreadable oracle parameters"));
    }
    std::string reason;
    if (!params.IsValid(&reason)) {
        throw db::StorageError(db::Status::Corruption("stored oracle parameters: " + reason));
    }
    return params;
}

void SaveParams(db::Database& db, const OracleParams& params) {
    db::Status status = db.Put(db::MakeKey(db::prefix::PARAMS),
                               db::SerializeToString(params));
    if (!status.ok()) {
        LOG_ERROR(util::LogCategory::DB) << "Failed to persist parameters: "
                                         << status.ToString();
        throw db::StorageError(status);
    }
}

} // namespace oracle
} // namespace valoria
