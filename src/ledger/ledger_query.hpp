#pragma once

#include <vector>

#include "common/enums.hpp"
#include "common/models.hpp"

namespace uptally {

// Reorders a ledger snapshot for listing. The selected fields form one
// combined key, compared in SortField declaration order no matter how the
// caller listed them. Records equal on the key keep sequence order. With no
// fields the result is sequence order. reverse inverts the final order.
std::vector<SessionRecord> orderLedger(std::vector<SessionRecord> ledger,
                                       const std::vector<SortField> &fields,
                                       bool reverse);

} // namespace uptally
