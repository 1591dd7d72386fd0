#pragma once

namespace uptally {

// Stored as an integer in the sessions table; keep the values stable.
enum class ShutdownKind {
    Ungraceful = 0,
    Graceful = 1
};

// Fields selectable for the composite listing order. The declaration order
// is the precedence order of the combined key.
enum class SortField {
    Uptime,
    ShutdownKind,
    Downtime,
    Kernel
};

} // namespace uptally
