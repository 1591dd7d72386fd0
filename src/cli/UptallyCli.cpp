#include "cli/UptallyCli.hpp"

#include <cmath>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

#include <QDateTime>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "ledger/ledger_query.hpp"
#include "ledger/ledger_view.hpp"
#include "ledger/observation_source.hpp"
#include "ledger/restart_detector.hpp"
#include "ledger/session_store.hpp"
#include "ledger/statistics.hpp"

namespace uptally {

namespace {

const QString kComponent = QStringLiteral("UptallyCli");

QString usageText()
{
    return QStringLiteral(
        "Usage: uptally [options]\n"
        "\n"
        "Records the current boot in the session ledger and reports statistics.\n"
        "\n"
        "  -f, --db PATH         session ledger (default $UPTALLY_DB or\n"
        "                        ~/.local/share/uptally/uptally.db)\n"
        "  -g, --graceful        mark the running session as shut down gracefully\n"
        "  -s, --silent          update the ledger without printing anything\n"
        "  -n, --no-update       do not write the ledger, report the live view\n"
        "  -l, --list            list every session\n"
        "  -t, --table           print every session as a table\n"
        "  -k, --kernel          show kernel labels\n"
        "  -o, --order FIELDS    order sessions by uptime,end,downtime,kernel\n"
        "  -r, --reverse         reverse the listing order\n"
        "      --format FORMAT   text (default) or json\n"
        "      --trace           write debug lines to the log\n"
        "  -h, --help            show this help\n");
}

std::string formatDuration(double seconds)
{
    const bool negative = seconds < 0.0;
    long long total = std::llround(std::fabs(seconds));
    const long long days = total / 86400;
    total %= 86400;

    std::ostringstream out;
    if (negative) {
        out << "-";
    }
    out << days << "d " << std::setfill('0')
        << std::setw(2) << total / 3600 << "h "
        << std::setw(2) << (total % 3600) / 60 << "m "
        << std::setw(2) << total % 60 << "s";
    return out.str();
}

std::string formatLocalTime(int64_t epochSeconds)
{
    return QDateTime::fromSecsSinceEpoch(epochSeconds)
        .toString(QStringLiteral("yyyy-MM-dd HH:mm:ss"))
        .toStdString();
}

std::string formatPercent(double value)
{
    std::ostringstream out;
    out << std::fixed << std::setprecision(2) << value << "%";
    return out.str();
}

const char *endLabel(ShutdownKind kind)
{
    return kind == ShutdownKind::Graceful ? "OK" : "BAD";
}

void renderExtreme(const char *label, const std::optional<ExtremeValue> &value,
                   const char *when, bool showKernel)
{
    std::cout << std::left << std::setw(20) << label;
    if (!value.has_value()) {
        std::cout << "none\n";
        return;
    }
    std::cout << formatDuration(value->seconds) << "   " << when << " "
              << formatLocalTime(value->epoch) << "\n";
    if (showKernel) {
        std::cout << std::setw(20) << "   with kernel:" << value->kernelLabel << "\n";
    }
}

void renderSummary(const LedgerStatistics &stats, const SessionRecord &current,
                   bool showKernel)
{
    std::cout << std::left;
    std::cout << std::setw(20) << "System startups:" << stats.sessionCount
              << "   since   " << formatLocalTime(stats.firstBootEpoch) << "\n";
    std::cout << std::setw(20) << "System shutdowns:" << stats.gracefulCount
              << " ok   <-   " << stats.ungracefulCount << " bad\n";
    if (showKernel) {
        std::cout << std::setw(20) << "System kernels:"
                  << stats.distinctKernelCount << "\n";
    }
    std::cout << std::setw(20) << "System life:"
              << formatDuration(stats.systemLifetime) << "\n\n";

    std::cout << std::setw(20) << "System uptime:" << formatPercent(stats.uptimeRatio)
              << "   =   " << formatDuration(stats.totalUptime) << "\n";
    std::cout << std::setw(20) << "System downtime:"
              << formatPercent(stats.downtimeRatio) << "   =   "
              << formatDuration(stats.totalDowntime) << "\n\n";

    std::cout << std::setw(20) << "Average uptime:"
              << formatDuration(stats.averageUptime) << "\n";
    std::cout << std::setw(20) << "Average downtime:"
              << formatDuration(stats.averageDowntime) << "\n\n";

    renderExtreme("Longest uptime:", stats.maxUptime, "from", showKernel);
    renderExtreme("Shortest uptime:", stats.minUptime, "from", showKernel);
    renderExtreme("Longest downtime:", stats.maxDowntime, "from", showKernel);
    renderExtreme("Shortest downtime:", stats.minDowntime, "from", showKernel);
    std::cout << "\n";

    std::cout << std::setw(20) << "Current uptime:"
              << formatDuration(current.uptimeSeconds) << "   since   "
              << formatLocalTime(current.bootEpoch) << "\n";
    if (showKernel) {
        std::cout << std::setw(20) << "   with kernel:" << current.kernelLabel << "\n";
    }
}

void renderList(const std::vector<SessionRecord> &sessions, bool showKernel)
{
    std::cout << std::left;
    for (const SessionRecord &record : sessions) {
        std::cout << std::setw(12) << "Startup:" << record.sequence << "  at  "
                  << formatLocalTime(record.bootEpoch) << "\n";
        std::cout << std::setw(12) << "Uptime:" << formatDuration(record.uptimeSeconds)
                  << "\n";
        if (!record.isOpen()) {
            std::cout << std::setw(12) << "Shutdown:" << endLabel(record.shutdownKind)
                      << "  at  " << formatLocalTime(record.shutdownEpoch) << "\n";
            std::cout << std::setw(12) << "Downtime:"
                      << formatDuration(record.downtimeSeconds) << "\n";
        }
        if (showKernel) {
            std::cout << std::setw(12) << "Kernel:" << record.kernelLabel << "\n";
        }
        std::cout << "\n";
    }
}

void renderTable(const std::vector<SessionRecord> &sessions, bool showKernel)
{
    std::cout << "| No. | Startup | Uptime | Shutdown | End | Downtime |";
    if (showKernel) {
        std::cout << " Kernel |";
    }
    std::cout << "\n|---|---|---|---|---|---|";
    if (showKernel) {
        std::cout << "---|";
    }
    std::cout << "\n";

    for (const SessionRecord &record : sessions) {
        std::cout << "| " << record.sequence << " | " << formatLocalTime(record.bootEpoch)
                  << " | " << formatDuration(record.uptimeSeconds) << " | ";
        if (record.isOpen()) {
            std::cout << " | | |";
        } else {
            std::cout << formatLocalTime(record.shutdownEpoch) << " | "
                      << endLabel(record.shutdownKind) << " | "
                      << formatDuration(record.downtimeSeconds) << " |";
        }
        if (showKernel) {
            std::cout << " " << record.kernelLabel << " |";
        }
        std::cout << "\n";
    }
}

void renderJson(const LedgerStatistics &stats, const std::vector<SessionRecord> &sessions,
                const std::string &databasePath, const DetectionOutcome *outcome)
{
    nlohmann::json payload;
    payload["database"] = databasePath;
    payload["persisted"] = outcome ? outcome->persisted : false;
    payload["restarted"] = outcome ? outcome->restarted : false;
    payload["statistics"] = stats;
    payload["sessions"] = sessions;
    std::cout << payload.dump(2) << std::endl;
}

} // namespace

UptallyCli::UptallyCli()
    : m_observe(&readCurrentObservation)
{
}

UptallyCli::UptallyCli(ObservationProvider observe)
    : m_observe(std::move(observe))
{
}

int UptallyCli::run(int argc, char *argv[])
{
    QStringList args;
    args.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        args.push_back(QString::fromLocal8Bit(argv[i]));
    }

    LedgerConfig config;
    bool helpRequested = false;
    if (!parseArguments(args, &config, &helpRequested)) {
        std::cerr << usageText().toStdString();
        return 1;
    }
    if (helpRequested) {
        std::cout << usageText().toStdString();
        return 0;
    }

    return execute(config);
}

bool UptallyCli::parseArguments(const QStringList &args, LedgerConfig *config,
                                bool *helpRequested) const
{
    config->databasePath = defaultDatabasePath();

    for (int i = 1; i < args.size(); ++i) {
        const QString &arg = args.at(i);
        if (arg == QStringLiteral("-h") || arg == QStringLiteral("--help")) {
            *helpRequested = true;
        } else if (arg == QStringLiteral("-g") || arg == QStringLiteral("--graceful")) {
            config->shutdownKind = ShutdownKind::Graceful;
        } else if (arg == QStringLiteral("-s") || arg == QStringLiteral("--silent")) {
            config->silent = true;
        } else if (arg == QStringLiteral("-n") || arg == QStringLiteral("--no-update")) {
            config->updateLedger = false;
        } else if (arg == QStringLiteral("-l") || arg == QStringLiteral("--list")) {
            config->mode = ReportMode::List;
        } else if (arg == QStringLiteral("-t") || arg == QStringLiteral("--table")) {
            config->mode = ReportMode::Table;
        } else if (arg == QStringLiteral("-k") || arg == QStringLiteral("--kernel")) {
            config->showKernel = true;
        } else if (arg == QStringLiteral("-r") || arg == QStringLiteral("--reverse")) {
            config->reverse = true;
        } else if (arg == QStringLiteral("-f") || arg == QStringLiteral("--db")) {
            if (i + 1 >= args.size() || args.at(i + 1).isEmpty()) {
                return false;
            }
            config->databasePath = args.at(++i).toStdString();
        } else if (arg == QStringLiteral("-o") || arg == QStringLiteral("--order")) {
            if (i + 1 >= args.size()) {
                return false;
            }
            if (!parseSortFields(args.at(++i).toStdString(), &config->order)) {
                std::cerr << "Invalid order field. Use uptime, end, downtime or kernel."
                          << std::endl;
                return false;
            }
        } else if (arg == QStringLiteral("--format")) {
            if (i + 1 >= args.size()) {
                return false;
            }
            const QString format = args.at(++i).toLower();
            if (format == QStringLiteral("json")) {
                config->format = ReportFormat::Json;
            } else if (format == QStringLiteral("text")) {
                config->format = ReportFormat::Text;
            } else {
                std::cerr << "Invalid format. Use text or json." << std::endl;
                return false;
            }
        } else {
            std::cerr << "Unknown option: " << arg.toStdString() << std::endl;
            return false;
        }
    }
    return true;
}

std::unique_ptr<SessionStore> UptallyCli::openStore(const LedgerConfig &config) const
{
    if (!config.updateLedger) {
        return std::make_unique<SessionStore>(config.databasePath,
                                              SessionStore::OpenMode::ReadOnly);
    }

    try {
        return std::make_unique<SessionStore>(config.databasePath);
    } catch (const StoreError &ex) {
        std::error_code error;
        if (!ex.readOnly() || !std::filesystem::exists(config.databasePath, error)) {
            throw;
        }
        ULOG_WARN(kComponent,
                  QStringLiteral("openStore"),
                  QStringLiteral("ledger_read_only_fallback"),
                  (nlohmann::json{{"db", config.databasePath}, {"error", ex.what()}}));
        return std::make_unique<SessionStore>(config.databasePath,
                                              SessionStore::OpenMode::ReadOnly);
    }
}

int UptallyCli::execute(const LedgerConfig &config)
{
    ULOG_INFO(kComponent,
              QStringLiteral("execute"),
              QStringLiteral("invocation_start"),
              (nlohmann::json{{"db", config.databasePath},
                              {"graceful", config.shutdownKind == ShutdownKind::Graceful},
                              {"update", config.updateLedger},
                              {"silent", config.silent}}));

    try {
        const Observation observation = m_observe();

        std::unique_ptr<SessionStore> store;
        std::vector<SessionRecord> records;
        std::optional<DetectionOutcome> outcome;
        try {
            store = openStore(config);
        } catch (const StoreError &ex) {
            if (config.updateLedger) {
                throw SessionBoundaryLost(ex.what(), config.databasePath);
            }
            // Reporting without a ledger: the live session alone.
            ULOG_WARN(kComponent,
                      QStringLiteral("execute"),
                      QStringLiteral("ledger_unavailable"),
                      (nlohmann::json{{"db", config.databasePath}, {"error", ex.what()}}));
        }

        if (store) {
            std::string integrityMessage;
            if (!store->integrityCheck(&integrityMessage)) {
                ULOG_WARN(kComponent,
                          QStringLiteral("execute"),
                          QStringLiteral("integrity_check_failed"),
                          (nlohmann::json{{"db", config.databasePath},
                                          {"result", integrityMessage}}));
            }
            if (config.updateLedger) {
                outcome = detectAndRecord(*store, observation, config);
            }
            records = store->listRecords();
        }

        if (config.silent) {
            return 0;
        }

        const LedgerSnapshot snapshot =
            makeLiveSnapshot(std::move(records), observation, config.shutdownKind);
        const std::vector<SessionRecord> ledger = snapshot.patched();
        const LedgerStatistics stats = computeStatistics(ledger);

        if (config.format == ReportFormat::Json) {
            renderJson(stats, orderLedger(ledger, config.order, config.reverse),
                       config.databasePath, outcome ? &*outcome : nullptr);
            return 0;
        }

        switch (config.mode) {
        case ReportMode::Summary:
            renderSummary(stats, ledger.back(), config.showKernel);
            break;
        case ReportMode::List:
            renderList(orderLedger(ledger, config.order, config.reverse),
                       config.showKernel);
            break;
        case ReportMode::Table:
            renderTable(orderLedger(ledger, config.order, config.reverse),
                        config.showKernel);
            break;
        }
    } catch (const SessionBoundaryLost &ex) {
        std::cerr << "uptally: " << ex.what() << "\n"
                  << "uptally: the end of the previous session could not be written to "
                  << ex.databasePath() << ".\n"
                  << "uptally: check write permission on the database and its directory,"
                  << " or run with the privileges that own it.\n";
        return 2;
    } catch (const std::exception &ex) {
        ULOG_ERROR(kComponent,
                   QStringLiteral("execute"),
                   QStringLiteral("invocation_failed"),
                   (nlohmann::json{{"error", ex.what()}}));
        std::cerr << "uptally: " << ex.what() << std::endl;
        return 1;
    }

    return 0;
}

} // namespace uptally
