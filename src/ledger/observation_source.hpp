#pragma once

#include <cstdint>
#include <optional>

#include <QString>

#include "common/models.hpp"

namespace uptally {

/**
 * Read the current boot epoch, uptime and kernel label of this host.
 *
 * bootEpoch comes from the btime line of /proc/stat, uptime from
 * /proc/uptime, both read back to back so the pair stays consistent.
 * Throws std::runtime_error when either file cannot be read or parsed.
 */
Observation readCurrentObservation();

// Parsers over the raw file contents, split out for testing.
std::optional<int64_t> parseBootEpoch(const QString &procStat);
std::optional<double> parseUptimeSeconds(const QString &procUptime);

// "<sysname>-<release>-<machine>" from uname(2), empty when uname fails.
std::string currentKernelLabel();

} // namespace uptally
