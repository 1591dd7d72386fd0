#pragma once

#include <string>
#include <vector>

#include "common/enums.hpp"

namespace uptally {

enum class ReportMode {
    Summary,
    List,
    Table
};

enum class ReportFormat {
    Text,
    Json
};

// Per-invocation settings. Built once in the CLI and handed down explicitly.
struct LedgerConfig {
    std::string databasePath;
    ShutdownKind shutdownKind = ShutdownKind::Ungraceful;
    bool silent = false;
    bool updateLedger = true;
    bool showKernel = false;

    ReportMode mode = ReportMode::Summary;
    ReportFormat format = ReportFormat::Text;
    std::vector<SortField> order;
    bool reverse = false;
};

// UPTALLY_DB if set, otherwise $HOME/.local/share/uptally/uptally.db.
std::string defaultDatabasePath();

// Directory holding the database and logs for the current user.
std::string dataDirPath();

// Parses "uptime,end,downtime,kernel" (any subset, any order, duplicates
// ignored). Returns false on an unknown field name.
bool parseSortFields(const std::string &text, std::vector<SortField> *fields);

} // namespace uptally
