#pragma once

#include <vector>

#include "common/models.hpp"

namespace uptally {

/**
 * Build the reporting view of the ledger for the running boot.
 *
 * The stored tail may be stale (read-only storage, --no-update). When the
 * observation still belongs to the stored tail's boot, the live values are
 * attached as a TailOverride. When it belongs to a later boot, or the ledger
 * is empty, the missing transition is represented in memory only, exactly as
 * detectAndRecord would have written it.
 */
LedgerSnapshot makeLiveSnapshot(std::vector<SessionRecord> records,
                                const Observation &observation,
                                ShutdownKind kind);

} // namespace uptally
