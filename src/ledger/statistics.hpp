#pragma once

#include <vector>

#include "common/models.hpp"

namespace uptally {

// Durations and percentages are reported to two decimals so repeated runs
// over unchanged data print identical numbers.
double roundTo2(double value);

/**
 * Summary metrics over a patched ledger (ordered by sequence, open tail last).
 *
 * A zero or negative lifetime yields zero ratios. A single-session ledger has
 * zero downtime and no downtime extremes. Extreme ties keep the first record.
 */
LedgerStatistics computeStatistics(const std::vector<SessionRecord> &ledger);

} // namespace uptally
