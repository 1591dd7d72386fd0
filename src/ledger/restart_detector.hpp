#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include "common/config.hpp"
#include "common/models.hpp"

namespace uptally {

class SessionStore;

// A detected session boundary could not be written. The previous session's
// end would be lost, so callers must treat this as fatal.
class SessionBoundaryLost : public std::runtime_error {
public:
    SessionBoundaryLost(const std::string &message, const std::string &databasePath)
        : std::runtime_error(message)
        , m_databasePath(databasePath)
    {
    }

    const std::string &databasePath() const
    {
        return m_databasePath;
    }

private:
    std::string m_databasePath;
};

struct DetectionOutcome {
    bool initialized = false;
    bool restarted = false;
    // False when a refresh could not be committed; the ledger on disk is
    // stale and reports must use the live tail.
    bool persisted = false;
    SessionRecord tail;
    std::optional<SessionRecord> closed;
};

// True when the observation belongs to a later boot than last.
// Boot-time jitter up to the current uptime is tolerated.
bool isRestart(const SessionRecord &last, const Observation &observation);

// Pure transitions, no storage involved.
SessionRecord refreshSession(const SessionRecord &last, const Observation &observation,
                             ShutdownKind kind);
SessionRecord closeSession(const SessionRecord &last, const Observation &observation,
                           ShutdownKind kind);
SessionRecord openSession(const Observation &observation);

// End state for a session closed by a restart: the requested kind, or the
// kind recorded on the tail when Ungraceful was requested.
ShutdownKind closingKind(const SessionRecord &last, ShutdownKind requested);

/**
 * Compare the ledger tail with a fresh observation and apply the resulting
 * mutation:
 * - empty ledger: append the first open record
 * - same boot: refresh the tail in place
 * - restart: close the tail and append a new open record atomically
 *
 * Throws SessionBoundaryLost when the first record or a restart cannot be
 * committed. A failed refresh is logged and reported via persisted == false.
 */
DetectionOutcome detectAndRecord(SessionStore &store,
                                 const Observation &observation,
                                 const LedgerConfig &config);

} // namespace uptally
