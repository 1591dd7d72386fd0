#include <QtTest/QtTest>

#include <QDir>
#include <QFile>
#include <QTemporaryDir>

#include <filesystem>
#include <iostream>
#include <sstream>

#include <nlohmann/json.hpp>

#include "cli/UptallyCli.hpp"
#include "common/logging.hpp"
#include "ledger/session_store.hpp"

class CliTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void init();

    void testFirstRunJson();
    void testRestartRecorded();
    void testGracefulFlag();
    void testSilentStillWrites();
    void testNoUpdateReportsLiveView();
    void testNoUpdateWithoutLedger();
    void testSummaryText();
    void testListAndTable();
    void testOrderedJson();
    void testUnwritableLocationIsFatal();
    void testReadOnlyFallbackAttempted();
    void testInvalidArguments();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
    QString m_dbPath;
    uptally::Observation m_observation;

    void observe(int64_t bootEpoch, double uptime, const std::string &kernel = "Linux-6.1.0-x86_64");
    int runCli(const QStringList &args, std::string &out);
    nlohmann::json runJson(const QStringList &extraArgs);
};

void CliTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void CliTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void CliTests::init()
{
    m_dbPath = m_tempDir.path() + "/state/uptally.db";
    std::error_code error;
    std::filesystem::remove(m_dbPath.toStdString(), error);
    std::filesystem::remove(m_dbPath.toStdString() + "-wal", error);
    std::filesystem::remove(m_dbPath.toStdString() + "-shm", error);
    QFile::remove(uptally::logging::logFilePath());
    observe(1000, 30);
}

void CliTests::observe(int64_t bootEpoch, double uptime, const std::string &kernel)
{
    m_observation.bootEpoch = bootEpoch;
    m_observation.uptimeSeconds = uptime;
    m_observation.kernelLabel = kernel;
}

int CliTests::runCli(const QStringList &args, std::string &out)
{
    std::stringstream buffer;
    auto *oldBuf = std::cout.rdbuf(buffer.rdbuf());
    auto *oldErr = std::cerr.rdbuf(buffer.rdbuf());

    uptally::UptallyCli cli([this]() { return m_observation; });
    std::vector<QByteArray> localArgs;
    std::vector<char *> rawArgs;
    for (const QString &arg : args) {
        localArgs.push_back(arg.toLocal8Bit());
    }
    for (auto &arg : localArgs) {
        rawArgs.push_back(arg.data());
    }

    const int result = cli.run(static_cast<int>(rawArgs.size()), rawArgs.data());

    std::cout.rdbuf(oldBuf);
    std::cerr.rdbuf(oldErr);
    out = buffer.str();
    return result;
}

nlohmann::json CliTests::runJson(const QStringList &extraArgs)
{
    std::string output;
    QStringList args = {"uptally", "--db", m_dbPath, "--format", "json"};
    args += extraArgs;
    const int code = runCli(args, output);
    if (code != 0) {
        qWarning("uptally exited with %d: %s", code, output.c_str());
        return nlohmann::json();
    }
    return nlohmann::json::parse(output);
}

void CliTests::testFirstRunJson()
{
    const auto parsed = runJson({});
    QVERIFY(parsed.is_object());
    QVERIFY(parsed["persisted"].get<bool>());
    QVERIFY(!parsed["restarted"].get<bool>());
    QCOMPARE(parsed["statistics"]["sessionCount"].get<int64_t>(), static_cast<int64_t>(1));
    QCOMPARE(static_cast<int>(parsed["sessions"].size()), 1);
    QVERIFY(QFile::exists(m_dbPath));
}

void CliTests::testRestartRecorded()
{
    observe(1000, 500);
    runJson({});

    observe(1600, 10);
    const auto parsed = runJson({});
    QVERIFY(parsed["restarted"].get<bool>());
    QCOMPARE(parsed["statistics"]["sessionCount"].get<int64_t>(), static_cast<int64_t>(2));
    QCOMPARE(parsed["statistics"]["ungracefulCount"].get<int64_t>(), static_cast<int64_t>(1));

    const auto &first = parsed["sessions"][0];
    QCOMPARE(first["shutdownEpoch"].get<int64_t>(), static_cast<int64_t>(1500));
    QCOMPARE(first["downtimeSeconds"].get<double>(), 100.0);
    QVERIFY(parsed["sessions"][1]["open"].get<bool>());
}

void CliTests::testGracefulFlag()
{
    observe(1000, 500);
    runJson({});
    runJson({"--graceful"});

    observe(1600, 200);
    const auto parsed = runJson({});
    QCOMPARE(parsed["statistics"]["gracefulCount"].get<int64_t>(), static_cast<int64_t>(1));
    QCOMPARE(parsed["statistics"]["ungracefulCount"].get<int64_t>(), static_cast<int64_t>(0));
    QCOMPARE(parsed["statistics"]["uptimeRatio"].get<double>(), 87.5);
    QCOMPARE(QString::fromStdString(parsed["sessions"][0]["shutdownKind"].get<std::string>()),
             QStringLiteral("graceful"));
}

void CliTests::testSilentStillWrites()
{
    std::string output;
    const int code = runCli({"uptally", "--db", m_dbPath, "--silent"}, output);
    QCOMPARE(code, 0);
    QVERIFY(output.empty());

    uptally::SessionStore store(m_dbPath.toStdString());
    QCOMPARE(store.rowCount(), static_cast<int64_t>(1));
}

void CliTests::testNoUpdateReportsLiveView()
{
    runJson({});

    observe(1000, 900);
    auto parsed = runJson({"--no-update"});
    QCOMPARE(parsed["sessions"][0]["uptimeSeconds"].get<double>(), 900.0);
    QVERIFY(!parsed["persisted"].get<bool>());

    observe(5000, 20);
    parsed = runJson({"-n"});
    QCOMPARE(parsed["statistics"]["sessionCount"].get<int64_t>(), static_cast<int64_t>(2));

    uptally::SessionStore store(m_dbPath.toStdString(),
                                uptally::SessionStore::OpenMode::ReadOnly);
    QCOMPARE(store.rowCount(), static_cast<int64_t>(1));
    QCOMPARE(store.lastRecord()->uptimeSeconds, 30.0);
}

void CliTests::testNoUpdateWithoutLedger()
{
    const auto parsed = runJson({"--no-update"});
    QCOMPARE(parsed["statistics"]["sessionCount"].get<int64_t>(), static_cast<int64_t>(1));
    QVERIFY(!QFile::exists(m_dbPath));
}

void CliTests::testSummaryText()
{
    observe(1000, 500);
    std::string output;
    QCOMPARE(runCli({"uptally", "--db", m_dbPath}, output), 0);
    observe(1600, 200);
    QCOMPARE(runCli({"uptally", "--db", m_dbPath, "-k"}, output), 0);

    QVERIFY(output.find("System startups:") != std::string::npos);
    QVERIFY(output.find("87.50%") != std::string::npos);
    QVERIFY(output.find("Longest downtime:") != std::string::npos);
    QVERIFY(output.find("Linux-6.1.0-x86_64") != std::string::npos);
    QVERIFY(output.find("System life:        0d 00h 13m 20s") != std::string::npos);
    QVERIFY(output.find("0d 00h 01m 40s") != std::string::npos);
}

void CliTests::testListAndTable()
{
    observe(1000, 500);
    runJson({});
    observe(1600, 200);

    std::string output;
    QCOMPARE(runCli({"uptally", "--db", m_dbPath, "--list"}, output), 0);
    QVERIFY(output.find("Startup:") != std::string::npos);
    QVERIFY(output.find("Shutdown:") != std::string::npos);

    QCOMPARE(runCli({"uptally", "--db", m_dbPath, "--table", "-k"}, output), 0);
    QVERIFY(output.find("| No. |") != std::string::npos);
    QVERIFY(output.find("Kernel") != std::string::npos);
}

void CliTests::testOrderedJson()
{
    observe(1000, 500);
    runJson({});
    observe(1600, 50);
    runJson({});
    observe(1700, 20);

    const auto parsed = runJson({"--order", "uptime"});
    QCOMPARE(parsed["sessions"][0]["sequence"].get<int64_t>(), static_cast<int64_t>(3));
    QCOMPARE(parsed["sessions"][2]["sequence"].get<int64_t>(), static_cast<int64_t>(1));

    const auto reversed = runJson({"--reverse"});
    QCOMPARE(reversed["sessions"][0]["sequence"].get<int64_t>(), static_cast<int64_t>(3));
    QCOMPARE(reversed["sessions"][2]["sequence"].get<int64_t>(), static_cast<int64_t>(1));
}

void CliTests::testUnwritableLocationIsFatal()
{
    const QString blocker = m_tempDir.path() + "/blocker";
    QFile file(blocker);
    QVERIFY(file.open(QIODevice::WriteOnly | QIODevice::Truncate));
    file.write("not a directory");
    file.close();

    std::string output;
    const int code = runCli({"uptally", "--db", blocker + "/uptally.db"}, output);
    QCOMPARE(code, 2);
    QVERIFY(output.find("could not be written") != std::string::npos);
}

void CliTests::testReadOnlyFallbackAttempted()
{
    // The ledger path exists but cannot be opened for writing.
    const QString occupied = m_tempDir.path() + "/occupied.db";
    QVERIFY(QDir().mkpath(occupied));

    std::string output;
    const int code = runCli({"uptally", "--db", occupied}, output);
    QCOMPARE(code, 2);
    QVERIFY(output.find("could not be written") != std::string::npos);

    QFile log(uptally::logging::logFilePath());
    QVERIFY(log.open(QIODevice::ReadOnly));
    const QByteArray lines = log.readAll();
    QVERIFY(lines.contains("\"what\":\"ledger_read_only_fallback\""));
    QVERIFY(lines.contains(occupied.toUtf8()));
}

void CliTests::testInvalidArguments()
{
    std::string output;
    QCOMPARE(runCli({"uptally", "--bogus"}, output), 1);
    QVERIFY(output.find("Usage:") != std::string::npos);

    QCOMPARE(runCli({"uptally", "--order", "sideways"}, output), 1);
    QCOMPARE(runCli({"uptally", "--format", "xml"}, output), 1);
    QCOMPARE(runCli({"uptally", "--db"}, output), 1);

    QCOMPARE(runCli({"uptally", "--help"}, output), 0);
    QVERIFY(output.find("--graceful") != std::string::npos);
}

QTEST_MAIN(CliTests)
#include "test_cli.moc"
