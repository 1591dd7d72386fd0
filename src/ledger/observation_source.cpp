#include "ledger/observation_source.hpp"

#include <stdexcept>
#include <string>

#include <QFile>
#include <QStringList>

#include <sys/utsname.h>

#include "common/logging.hpp"

namespace uptally {

namespace {

constexpr const char *kProcStatPath = "/proc/stat";
constexpr const char *kProcUptimePath = "/proc/uptime";

QString readProcFile(const char *path)
{
    // proc files report size 0, so read until EOF instead of trusting size().
    QFile file(QString::fromLatin1(path));
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        throw std::runtime_error(std::string("failed to open ") + path);
    }
    return QString::fromUtf8(file.readAll());
}

} // namespace

std::optional<int64_t> parseBootEpoch(const QString &procStat)
{
    const QStringList lines = procStat.split(QChar('\n'), Qt::SkipEmptyParts);
    for (const QString &line : lines) {
        const QStringList tokens = line.simplified().split(QChar(' '));
        if (tokens.size() < 2 || tokens[0] != QStringLiteral("btime")) {
            continue;
        }
        bool ok = false;
        const qlonglong value = tokens[1].toLongLong(&ok);
        if (!ok || value <= 0) {
            return std::nullopt;
        }
        return static_cast<int64_t>(value);
    }
    return std::nullopt;
}

std::optional<double> parseUptimeSeconds(const QString &procUptime)
{
    const QStringList tokens = procUptime.simplified().split(QChar(' '));
    if (tokens.isEmpty()) {
        return std::nullopt;
    }
    bool ok = false;
    const double value = tokens[0].toDouble(&ok);
    if (!ok || value < 0.0) {
        return std::nullopt;
    }
    return value;
}

std::string currentKernelLabel()
{
    struct utsname info {};
    if (uname(&info) != 0) {
        return {};
    }
    return std::string(info.sysname) + "-" + info.release + "-" + info.machine;
}

Observation readCurrentObservation()
{
    const QString stat = readProcFile(kProcStatPath);
    const QString uptime = readProcFile(kProcUptimePath);

    const auto bootEpoch = parseBootEpoch(stat);
    if (!bootEpoch.has_value()) {
        throw std::runtime_error("no btime entry in /proc/stat");
    }
    const auto uptimeSeconds = parseUptimeSeconds(uptime);
    if (!uptimeSeconds.has_value()) {
        throw std::runtime_error("unparsable /proc/uptime");
    }

    Observation observation;
    observation.bootEpoch = *bootEpoch;
    observation.uptimeSeconds = *uptimeSeconds;
    observation.kernelLabel = currentKernelLabel();

    ULOG_DEBUG(QStringLiteral("ObservationSource"),
               QStringLiteral("readCurrentObservation"),
               QStringLiteral("observation_read"),
               (nlohmann::json{{"bootEpoch", observation.bootEpoch},
                               {"uptime", observation.uptimeSeconds},
                               {"kernel", observation.kernelLabel}}));
    return observation;
}

} // namespace uptally
