#pragma once

#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace uptally {

inline std::string toIso8601Utc(int64_t epochSeconds)
{
    const std::time_t time = static_cast<std::time_t>(epochSeconds);
    std::tm tm{};
    gmtime_r(&time, &tm);
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

inline std::string toShutdownKindString(ShutdownKind kind)
{
    switch (kind) {
    case ShutdownKind::Graceful:
        return "graceful";
    case ShutdownKind::Ungraceful:
        return "ungraceful";
    }
    return "ungraceful";
}

inline void to_json(nlohmann::json &j, const ShutdownKind &kind)
{
    j = toShutdownKindString(kind);
}

// Open records serialize their end and downtime as null.
inline void to_json(nlohmann::json &j, const SessionRecord &record)
{
    j = nlohmann::json{
        {"sequence", record.sequence},
        {"bootEpoch", record.bootEpoch},
        {"boot", toIso8601Utc(record.bootEpoch)},
        {"uptimeSeconds", record.uptimeSeconds},
        {"kernel", record.kernelLabel},
        {"open", record.isOpen()}
    };
    if (record.isOpen()) {
        j["shutdownEpoch"] = nullptr;
        j["shutdown"] = nullptr;
        j["shutdownKind"] = nullptr;
        j["downtimeSeconds"] = nullptr;
    } else {
        j["shutdownEpoch"] = record.shutdownEpoch;
        j["shutdown"] = toIso8601Utc(record.shutdownEpoch);
        j["shutdownKind"] = record.shutdownKind;
        j["downtimeSeconds"] = record.downtimeSeconds;
    }
}

inline void to_json(nlohmann::json &j, const ExtremeValue &value)
{
    j = nlohmann::json{
        {"seconds", value.seconds},
        {"epoch", value.epoch},
        {"at", toIso8601Utc(value.epoch)},
        {"kernel", value.kernelLabel}
    };
}

inline void to_json(nlohmann::json &j, const LedgerStatistics &stats)
{
    j = nlohmann::json{
        {"sessionCount", stats.sessionCount},
        {"gracefulCount", stats.gracefulCount},
        {"ungracefulCount", stats.ungracefulCount},
        {"distinctKernelCount", stats.distinctKernelCount},
        {"firstBoot", toIso8601Utc(stats.firstBootEpoch)},
        {"totalUptime", stats.totalUptime},
        {"totalDowntime", stats.totalDowntime},
        {"systemLifetime", stats.systemLifetime},
        {"uptimeRatio", stats.uptimeRatio},
        {"downtimeRatio", stats.downtimeRatio},
        {"averageUptime", stats.averageUptime},
        {"averageDowntime", stats.averageDowntime},
        {"maxUptime", stats.maxUptime},
        {"minUptime", stats.minUptime}
    };
    j["maxDowntime"] = stats.maxDowntime.has_value()
        ? nlohmann::json(*stats.maxDowntime)
        : nlohmann::json(nullptr);
    j["minDowntime"] = stats.minDowntime.has_value()
        ? nlohmann::json(*stats.minDowntime)
        : nlohmann::json(nullptr);
}

} // namespace uptally
