// VALORIA - Time Utilities Implementation
// Copyright (c) 2024 VALORIA Developers
// MIT License

#include "valoria/util/time.h"

#include <atomic>
#include <ctime>
#include <iomanip>
#include <mutex>
#include <sstream>

namespace valoria {
namespace util {

namespace {
    std::atomic<bool> g_mockTimeEnabled{false};
    std::atomic<int64_t> g_mockTime{0};
    std::mutex g_mockTimeMutex;

    int64_t WallClockSeconds() {
        return std::chrono::duration_cast<Seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }
}

int64_t GetTime() {
    if (g_mockTimeEnabled.load()) {
        return g_mockTime.load();
    }
    return WallClockSeconds();
}

// ============================================================================
// Formatting
// ============================================================================

std::string FormatISO8601(int64_t timestamp) {
    const std::time_t time = static_cast<std::time_t>(timestamp);
    std::tm utc{};
    if (static_cast<int64_t>(time) != timestamp || gmtime_r(&time, &utc) == nullptr) {
        return "@" + std::to_string(timestamp);
    }

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

std::string FormatLog(SystemTimePoint tp) {
    const std::time_t time = std::chrono::system_clock::to_time_t(tp);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()) % 1000;

    std::tm local{};
    if (localtime_r(&time, &local) == nullptr) {
        return "@" + std::to_string(static_cast<int64_t>(time));
    }

    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

std::string FormatDuration(Seconds duration) {
    int64_t total = duration.count();
    if (total == 0) {
        return "0s";
    }

    std::ostringstream oss;
    if (total < 0) {
        oss << '-';
        total = -total;
    }

    const int64_t parts[] = {
        total / SECONDS_PER_DAY,
        (total % SECONDS_PER_DAY) / SECONDS_PER_HOUR,
        (total % SECONDS_PER_HOUR) / SECONDS_PER_MINUTE,
        total % SECONDS_PER_MINUTE,
    };
    const char units[] = {'d', 'h', 'm', 's'};

    bool first = true;
    for (size_t i = 0; i < 4; ++i) {
        if (parts[i] == 0) continue;
        if (!first) oss << ' ';
        oss << parts[i] << units[i];
        first = false;
    }
    return oss.str();
}

// ============================================================================
// Mock Time
// ============================================================================

void EnableMockTime() {
    std::lock_guard<std::mutex> lock(g_mockTimeMutex);
    if (g_mockTime.load() == 0) {
        g_mockTime.store(WallClockSeconds());
    }
    g_mockTimeEnabled.store(true);
}

void DisableMockTime() {
    std::lock_guard<std::mutex> lock(g_mockTimeMutex);
    g_mockTimeEnabled.store(false);
}

void SetMockTime(int64_t timestamp) {
    g_mockTime.store(timestamp);
}

void AdvanceMockTime(Seconds duration) {
    g_mockTime.fetch_add(duration.count());
}

} // namespace util
} // namespace valoria
