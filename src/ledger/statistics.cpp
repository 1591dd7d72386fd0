#include "ledger/statistics.hpp"

#include <cmath>
#include <set>
#include <string>

#include "common/logging.hpp"

namespace uptally {

namespace {

double percentOf(double part, double whole)
{
    if (whole <= 0.0) {
        return 0.0;
    }
    return roundTo2(100.0 * part / whole);
}

ExtremeValue uptimeExtreme(const SessionRecord &record)
{
    return ExtremeValue{roundTo2(record.uptimeSeconds), record.bootEpoch,
                        record.kernelLabel};
}

ExtremeValue downtimeExtreme(const SessionRecord &record)
{
    return ExtremeValue{roundTo2(record.downtimeSeconds), record.shutdownEpoch,
                        record.kernelLabel};
}

} // namespace

double roundTo2(double value)
{
    return std::round(value * 100.0) / 100.0;
}

LedgerStatistics computeStatistics(const std::vector<SessionRecord> &ledger)
{
    LedgerStatistics stats;
    if (ledger.empty()) {
        return stats;
    }

    const SessionRecord &first = ledger.front();
    const SessionRecord &tail = ledger.back();

    stats.sessionCount = static_cast<int64_t>(ledger.size());
    stats.firstBootEpoch = first.bootEpoch;

    double totalUptime = 0.0;
    std::set<std::string> kernels;
    const SessionRecord *maxUp = &first;
    const SessionRecord *minUp = &first;
    const SessionRecord *maxDown = nullptr;
    const SessionRecord *minDown = nullptr;
    int64_t previousBoot = first.bootEpoch;
    bool bootOrderBroken = false;

    for (const SessionRecord &record : ledger) {
        totalUptime += record.uptimeSeconds;
        kernels.insert(record.kernelLabel);

        if (record.uptimeSeconds > maxUp->uptimeSeconds) {
            maxUp = &record;
        }
        if (record.uptimeSeconds < minUp->uptimeSeconds) {
            minUp = &record;
        }

        if (record.bootEpoch < previousBoot) {
            bootOrderBroken = true;
        }
        previousBoot = record.bootEpoch;

        if (record.isOpen()) {
            continue;
        }
        if (record.shutdownKind == ShutdownKind::Graceful) {
            ++stats.gracefulCount;
        }
        if (!maxDown || record.downtimeSeconds > maxDown->downtimeSeconds) {
            maxDown = &record;
        }
        if (!minDown || record.downtimeSeconds < minDown->downtimeSeconds) {
            minDown = &record;
        }
    }

    const double lifetime =
        static_cast<double>(tail.bootEpoch) + tail.uptimeSeconds
        - static_cast<double>(first.bootEpoch);
    const double totalDowntime = stats.sessionCount == 1 ? 0.0 : lifetime - totalUptime;

    if (bootOrderBroken || lifetime <= 0.0) {
        ULOG_WARN(QStringLiteral("Statistics"),
                  QStringLiteral("computeStatistics"),
                  QStringLiteral("clock_anomaly"),
                  (nlohmann::json{{"bootOrderBroken", bootOrderBroken},
                                  {"lifetime", lifetime}}));
    }

    stats.ungracefulCount = (stats.sessionCount - 1) - stats.gracefulCount;
    stats.distinctKernelCount = static_cast<int64_t>(kernels.size());

    stats.totalUptime = roundTo2(totalUptime);
    stats.totalDowntime = roundTo2(totalDowntime);
    stats.systemLifetime = roundTo2(lifetime);
    stats.uptimeRatio = percentOf(totalUptime, lifetime);
    stats.downtimeRatio = percentOf(totalDowntime, lifetime);
    stats.averageUptime = roundTo2(totalUptime / static_cast<double>(stats.sessionCount));
    stats.averageDowntime =
        roundTo2(totalDowntime / static_cast<double>(stats.sessionCount));

    stats.maxUptime = uptimeExtreme(*maxUp);
    stats.minUptime = uptimeExtreme(*minUp);
    if (stats.sessionCount > 1 && maxDown && minDown) {
        stats.maxDowntime = downtimeExtreme(*maxDown);
        stats.minDowntime = downtimeExtreme(*minDown);
    }

    return stats;
}

} // namespace uptally
