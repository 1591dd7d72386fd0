#include "ledger/ledger_view.hpp"

#include "ledger/restart_detector.hpp"

namespace uptally {

std::vector<SessionRecord> LedgerSnapshot::patched() const
{
    std::vector<SessionRecord> view = records;
    if (view.empty() || !liveTail.has_value()) {
        return view;
    }

    SessionRecord &tail = view.back();
    tail.uptimeSeconds = liveTail->uptimeSeconds;
    tail.shutdownKind = liveTail->shutdownKind;
    tail.kernelLabel = liveTail->kernelLabel;
    return view;
}

LedgerSnapshot makeLiveSnapshot(std::vector<SessionRecord> records,
                                const Observation &observation,
                                ShutdownKind kind)
{
    LedgerSnapshot snapshot;

    if (!records.empty() && isRestart(records.back(), observation)) {
        const int64_t nextSequence = records.back().sequence + 1;
        records.back() = closeSession(records.back(), observation,
                                      closingKind(records.back(), kind));
        SessionRecord next = openSession(observation);
        next.sequence = nextSequence;
        records.push_back(next);
    } else if (records.empty()) {
        SessionRecord first = openSession(observation);
        first.sequence = 1;
        records.push_back(first);
    }

    snapshot.records = std::move(records);
    snapshot.liveTail = TailOverride{observation.uptimeSeconds, kind,
                                     observation.kernelLabel};
    return snapshot;
}

} // namespace uptally
