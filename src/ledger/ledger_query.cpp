#include "ledger/ledger_query.hpp"

#include <algorithm>

namespace uptally {

namespace {

// -1, 0 or 1 for a single field.
int compareField(const SessionRecord &a, const SessionRecord &b, SortField field)
{
    switch (field) {
    case SortField::Uptime:
        return (a.uptimeSeconds > b.uptimeSeconds) - (a.uptimeSeconds < b.uptimeSeconds);
    case SortField::ShutdownKind:
        return static_cast<int>(a.shutdownKind) - static_cast<int>(b.shutdownKind);
    case SortField::Downtime:
        return (a.downtimeSeconds > b.downtimeSeconds)
            - (a.downtimeSeconds < b.downtimeSeconds);
    case SortField::Kernel: {
        const int cmp = a.kernelLabel.compare(b.kernelLabel);
        return (cmp > 0) - (cmp < 0);
    }
    }
    return 0;
}

} // namespace

std::vector<SessionRecord> orderLedger(std::vector<SessionRecord> ledger,
                                       const std::vector<SortField> &fields,
                                       bool reverse)
{
    std::stable_sort(ledger.begin(), ledger.end(),
                     [](const SessionRecord &a, const SessionRecord &b) {
                         return a.sequence < b.sequence;
                     });

    std::vector<SortField> key = fields;
    std::sort(key.begin(), key.end());
    key.erase(std::unique(key.begin(), key.end()), key.end());

    if (!key.empty()) {
        std::stable_sort(ledger.begin(), ledger.end(),
                         [&key](const SessionRecord &a, const SessionRecord &b) {
                             for (const SortField field : key) {
                                 const int cmp = compareField(a, b, field);
                                 if (cmp != 0) {
                                     return cmp < 0;
                                 }
                             }
                             return false;
                         });
    }

    if (reverse) {
        std::reverse(ledger.begin(), ledger.end());
    }
    return ledger;
}

} // namespace uptally
