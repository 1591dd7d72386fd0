#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "common/enums.hpp"

namespace uptally {

constexpr int64_t kOpenShutdownEpoch = -1;
constexpr double kOpenDowntime = -1.0;

// One boot cycle. The record with the largest sequence is the only one
// allowed to be open (shutdownEpoch == -1).
struct SessionRecord {
    int64_t sequence = 0;
    int64_t bootEpoch = 0;
    double uptimeSeconds = 0.0;
    int64_t shutdownEpoch = kOpenShutdownEpoch;
    ShutdownKind shutdownKind = ShutdownKind::Ungraceful;
    double downtimeSeconds = kOpenDowntime;
    std::string kernelLabel;

    bool isOpen() const
    {
        return shutdownEpoch == kOpenShutdownEpoch;
    }
};

// A single consistent reading of the running system.
struct Observation {
    int64_t bootEpoch = 0;
    double uptimeSeconds = 0.0;
    std::string kernelLabel;
};

// Live values laid over the stored tail when building reports.
struct TailOverride {
    double uptimeSeconds = 0.0;
    ShutdownKind shutdownKind = ShutdownKind::Ungraceful;
    std::string kernelLabel;
};

struct LedgerSnapshot {
    std::vector<SessionRecord> records;
    std::optional<TailOverride> liveTail;

    // Copy of records with liveTail applied to the last one.
    std::vector<SessionRecord> patched() const;
};

struct ExtremeValue {
    double seconds = 0.0;
    int64_t epoch = 0;
    std::string kernelLabel;
};

struct LedgerStatistics {
    int64_t sessionCount = 0;
    int64_t gracefulCount = 0;
    int64_t ungracefulCount = 0;
    int64_t distinctKernelCount = 0;

    int64_t firstBootEpoch = 0;

    double totalUptime = 0.0;
    double totalDowntime = 0.0;
    double systemLifetime = 0.0;
    double uptimeRatio = 0.0;
    double downtimeRatio = 0.0;
    double averageUptime = 0.0;
    double averageDowntime = 0.0;

    ExtremeValue maxUptime;
    ExtremeValue minUptime;
    // Only closed sessions have a downtime; absent for a single-session ledger.
    std::optional<ExtremeValue> maxDowntime;
    std::optional<ExtremeValue> minDowntime;
};

} // namespace uptally
