#include "ledger/restart_detector.hpp"

#include <cmath>

#include "common/logging.hpp"
#include "ledger/session_store.hpp"

namespace uptally {

namespace {

const QString kComponent = QStringLiteral("RestartDetector");

void warnIfPruned(const SessionStore &store, const SessionRecord &tail)
{
    int64_t rows = 0;
    try {
        rows = store.rowCount();
    } catch (const StoreError &ex) {
        ULOG_WARN(kComponent,
                  QStringLiteral("warnIfPruned"),
                  QStringLiteral("row_count_failed"),
                  (nlohmann::json{{"error", ex.what()}}));
        return;
    }
    if (rows != tail.sequence) {
        ULOG_WARN(kComponent,
                  QStringLiteral("detectAndRecord"),
                  QStringLiteral("ledger_rows_missing"),
                  (nlohmann::json{{"rows", rows}, {"tailSequence", tail.sequence}}));
    }
}

} // namespace

bool isRestart(const SessionRecord &last, const Observation &observation)
{
    return static_cast<double>(last.bootEpoch) + observation.uptimeSeconds
        < static_cast<double>(observation.bootEpoch);
}

SessionRecord refreshSession(const SessionRecord &last, const Observation &observation,
                             ShutdownKind kind)
{
    SessionRecord refreshed = last;
    refreshed.uptimeSeconds = observation.uptimeSeconds;
    refreshed.shutdownKind = kind;
    refreshed.kernelLabel = observation.kernelLabel;
    return refreshed;
}

SessionRecord closeSession(const SessionRecord &last, const Observation &observation,
                           ShutdownKind kind)
{
    // Last instant the previous boot was seen alive.
    const int64_t estimatedShutdown = static_cast<int64_t>(
        std::llround(static_cast<double>(last.bootEpoch) + last.uptimeSeconds));

    SessionRecord closed = last;
    closed.shutdownEpoch = estimatedShutdown;
    closed.downtimeSeconds = static_cast<double>(observation.bootEpoch - estimatedShutdown);
    closed.shutdownKind = kind;
    return closed;
}

ShutdownKind closingKind(const SessionRecord &last, ShutdownKind requested)
{
    // A graceful mark left by a refresh before shutdown survives a boot-time
    // run that does not pass the flag again.
    if (requested == ShutdownKind::Graceful) {
        return ShutdownKind::Graceful;
    }
    return last.shutdownKind;
}

SessionRecord openSession(const Observation &observation)
{
    SessionRecord record;
    record.bootEpoch = observation.bootEpoch;
    record.uptimeSeconds = observation.uptimeSeconds;
    record.kernelLabel = observation.kernelLabel;
    record.shutdownEpoch = kOpenShutdownEpoch;
    record.downtimeSeconds = kOpenDowntime;
    return record;
}

DetectionOutcome detectAndRecord(SessionStore &store,
                                 const Observation &observation,
                                 const LedgerConfig &config)
{
    DetectionOutcome outcome;

    std::optional<SessionRecord> last;
    try {
        last = store.lastRecord();
    } catch (const StoreError &ex) {
        throw SessionBoundaryLost(std::string("cannot read session ledger: ") + ex.what(),
                                  store.path());
    }

    if (!last.has_value()) {
        SessionRecord first = openSession(observation);
        try {
            first.sequence = store.appendOpen(first);
        } catch (const StoreError &ex) {
            ULOG_ERROR(kComponent,
                       QStringLiteral("detectAndRecord"),
                       QStringLiteral("ledger_init_failed"),
                       (nlohmann::json{{"db", store.path()}, {"error", ex.what()}}));
            throw SessionBoundaryLost(std::string("cannot initialize session ledger: ")
                                          + ex.what(),
                                      store.path());
        }
        ULOG_INFO(kComponent,
                  QStringLiteral("detectAndRecord"),
                  QStringLiteral("ledger_initialized"),
                  (nlohmann::json{{"db", store.path()}, {"bootEpoch", first.bootEpoch}}));
        outcome.initialized = true;
        outcome.persisted = true;
        outcome.tail = first;
        return outcome;
    }

    if (!isRestart(*last, observation)) {
        outcome.tail = refreshSession(*last, observation, config.shutdownKind);
        try {
            store.updateOpen(outcome.tail);
            outcome.persisted = true;
            ULOG_DEBUG(kComponent,
                       QStringLiteral("detectAndRecord"),
                       QStringLiteral("session_refreshed"),
                       (nlohmann::json{{"sequence", outcome.tail.sequence},
                                       {"uptime", outcome.tail.uptimeSeconds}}));
        } catch (const StoreError &ex) {
            // Nothing is lost: the next writable run records the same boot.
            ULOG_WARN(kComponent,
                      QStringLiteral("detectAndRecord"),
                      QStringLiteral("session_refresh_not_persisted"),
                      (nlohmann::json{{"db", store.path()},
                                      {"readOnly", ex.readOnly()},
                                      {"error", ex.what()}}));
            outcome.persisted = false;
        }
        warnIfPruned(store, outcome.tail);
        return outcome;
    }

    const SessionRecord closed =
        closeSession(*last, observation, closingKind(*last, config.shutdownKind));
    SessionRecord next = openSession(observation);

    if (closed.downtimeSeconds < 0.0) {
        ULOG_WARN(kComponent,
                  QStringLiteral("detectAndRecord"),
                  QStringLiteral("clock_anomaly"),
                  (nlohmann::json{{"sequence", closed.sequence},
                                  {"estimatedShutdown", closed.shutdownEpoch},
                                  {"nextBootEpoch", next.bootEpoch}}));
    }

    try {
        next.sequence = store.closeAndAppend(closed, next);
    } catch (const StoreError &ex) {
        ULOG_ERROR(kComponent,
                   QStringLiteral("detectAndRecord"),
                   QStringLiteral("session_boundary_lost"),
                   (nlohmann::json{{"db", store.path()},
                                   {"readOnly", ex.readOnly()},
                                   {"error", ex.what()}}));
        throw SessionBoundaryLost(std::string("cannot record system restart: ") + ex.what(),
                                  store.path());
    }

    ULOG_INFO(kComponent,
              QStringLiteral("detectAndRecord"),
              QStringLiteral("restart_detected"),
              (nlohmann::json{{"closedSequence", closed.sequence},
                              {"shutdownEpoch", closed.shutdownEpoch},
                              {"downtime", closed.downtimeSeconds},
                              {"graceful", closed.shutdownKind == ShutdownKind::Graceful},
                              {"newSequence", next.sequence}}));

    outcome.restarted = true;
    outcome.persisted = true;
    outcome.closed = closed;
    outcome.tail = next;
    warnIfPruned(store, outcome.tail);
    return outcome;
}

} // namespace uptally
