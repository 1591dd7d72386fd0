#include <QtTest/QtTest>

#include <QTemporaryDir>

#include <cmath>

#include "ledger/statistics.hpp"

namespace {

uptally::SessionRecord closedRecord(int64_t sequence, int64_t bootEpoch, double uptime,
                                    double downtime, uptally::ShutdownKind kind,
                                    const std::string &kernel = "Linux-6.1.0-x86_64")
{
    uptally::SessionRecord record;
    record.sequence = sequence;
    record.bootEpoch = bootEpoch;
    record.uptimeSeconds = uptime;
    record.shutdownEpoch = bootEpoch + static_cast<int64_t>(uptime);
    record.downtimeSeconds = downtime;
    record.shutdownKind = kind;
    record.kernelLabel = kernel;
    return record;
}

uptally::SessionRecord openRecord(int64_t sequence, int64_t bootEpoch, double uptime,
                                  const std::string &kernel = "Linux-6.1.0-x86_64")
{
    uptally::SessionRecord record;
    record.sequence = sequence;
    record.bootEpoch = bootEpoch;
    record.uptimeSeconds = uptime;
    record.kernelLabel = kernel;
    return record;
}

} // namespace

class StatisticsTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();

    void testTwoSessionExample();
    void testSingleSession();
    void testZeroLifetime();
    void testExtremesAndTies();
    void testDowntimeExtremesIgnoreOpenTail();
    void testUptimePlusDowntimeIsLifetime();
    void testBootOrderAnomalyDoesNotThrow();
    void testRounding();
    void testEmptyLedger();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
};

void StatisticsTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void StatisticsTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void StatisticsTests::testTwoSessionExample()
{
    const std::vector<uptally::SessionRecord> ledger = {
        closedRecord(1, 1000, 500, 100, uptally::ShutdownKind::Graceful),
        openRecord(2, 1600, 200),
    };

    const auto stats = uptally::computeStatistics(ledger);
    QCOMPARE(stats.sessionCount, static_cast<int64_t>(2));
    QCOMPARE(stats.totalUptime, 700.0);
    QCOMPARE(stats.systemLifetime, 800.0);
    QCOMPARE(stats.totalDowntime, 100.0);
    QCOMPARE(stats.uptimeRatio, 87.5);
    QCOMPARE(stats.downtimeRatio, 12.5);
    QCOMPARE(stats.gracefulCount, static_cast<int64_t>(1));
    QCOMPARE(stats.ungracefulCount, static_cast<int64_t>(0));
    QCOMPARE(stats.averageUptime, 350.0);
    QCOMPARE(stats.averageDowntime, 50.0);
    QCOMPARE(stats.firstBootEpoch, static_cast<int64_t>(1000));
    QCOMPARE(stats.distinctKernelCount, static_cast<int64_t>(1));
}

void StatisticsTests::testSingleSession()
{
    const std::vector<uptally::SessionRecord> ledger = {openRecord(1, 1000, 250)};

    const auto stats = uptally::computeStatistics(ledger);
    QCOMPARE(stats.sessionCount, static_cast<int64_t>(1));
    QCOMPARE(stats.totalDowntime, 0.0);
    QCOMPARE(stats.downtimeRatio, 0.0);
    QCOMPARE(stats.uptimeRatio, 100.0);
    QCOMPARE(stats.gracefulCount, static_cast<int64_t>(0));
    QCOMPARE(stats.ungracefulCount, static_cast<int64_t>(0));
    QVERIFY(!stats.maxDowntime.has_value());
    QVERIFY(!stats.minDowntime.has_value());
    QCOMPARE(stats.maxUptime.seconds, 250.0);
    QCOMPARE(stats.minUptime.epoch, static_cast<int64_t>(1000));
}

void StatisticsTests::testZeroLifetime()
{
    const std::vector<uptally::SessionRecord> ledger = {openRecord(1, 1000, 0)};

    const auto stats = uptally::computeStatistics(ledger);
    QCOMPARE(stats.systemLifetime, 0.0);
    QCOMPARE(stats.uptimeRatio, 0.0);
    QCOMPARE(stats.downtimeRatio, 0.0);
}

void StatisticsTests::testExtremesAndTies()
{
    const std::vector<uptally::SessionRecord> ledger = {
        closedRecord(1, 1000, 300, 50, uptally::ShutdownKind::Graceful, "k-a"),
        closedRecord(2, 1350, 900, 50, uptally::ShutdownKind::Ungraceful, "k-b"),
        closedRecord(3, 2300, 900, 10, uptally::ShutdownKind::Ungraceful, "k-c"),
        openRecord(4, 3210, 300, "k-c"),
    };

    const auto stats = uptally::computeStatistics(ledger);
    // Ties resolve to the earliest record.
    QCOMPARE(stats.maxUptime.seconds, 900.0);
    QCOMPARE(stats.maxUptime.epoch, static_cast<int64_t>(1350));
    QCOMPARE(QString::fromStdString(stats.maxUptime.kernelLabel), QStringLiteral("k-b"));
    QCOMPARE(stats.minUptime.epoch, static_cast<int64_t>(1000));

    QVERIFY(stats.maxDowntime.has_value());
    QCOMPARE(stats.maxDowntime->seconds, 50.0);
    QCOMPARE(stats.maxDowntime->epoch, static_cast<int64_t>(1300));
    QCOMPARE(stats.minDowntime->seconds, 10.0);
    QCOMPARE(stats.minDowntime->epoch, static_cast<int64_t>(3200));

    QCOMPARE(stats.gracefulCount, static_cast<int64_t>(1));
    QCOMPARE(stats.ungracefulCount, static_cast<int64_t>(2));
    QCOMPARE(stats.distinctKernelCount, static_cast<int64_t>(3));
}

void StatisticsTests::testDowntimeExtremesIgnoreOpenTail()
{
    const std::vector<uptally::SessionRecord> ledger = {
        closedRecord(1, 1000, 100, 40, uptally::ShutdownKind::Ungraceful),
        openRecord(2, 1140, 10),
    };

    const auto stats = uptally::computeStatistics(ledger);
    QVERIFY(stats.minDowntime.has_value());
    QCOMPARE(stats.minDowntime->seconds, 40.0);
    QCOMPARE(stats.maxDowntime->seconds, 40.0);
}

void StatisticsTests::testUptimePlusDowntimeIsLifetime()
{
    const std::vector<uptally::SessionRecord> ledger = {
        closedRecord(1, 1000, 123.456, 77.544, uptally::ShutdownKind::Ungraceful),
        closedRecord(2, 1201, 3600.125, 600, uptally::ShutdownKind::Graceful),
        openRecord(3, 5401, 42.75),
    };

    const auto stats = uptally::computeStatistics(ledger);
    QVERIFY(std::fabs(stats.totalUptime + stats.totalDowntime - stats.systemLifetime)
            <= 0.02);
    QVERIFY(std::fabs(stats.uptimeRatio + stats.downtimeRatio - 100.0) <= 0.02);
}

void StatisticsTests::testBootOrderAnomalyDoesNotThrow()
{
    const std::vector<uptally::SessionRecord> ledger = {
        closedRecord(1, 5000, 100, 10, uptally::ShutdownKind::Ungraceful),
        openRecord(2, 1000, 100),
    };

    const auto stats = uptally::computeStatistics(ledger);
    QCOMPARE(stats.sessionCount, static_cast<int64_t>(2));
    QVERIFY(stats.systemLifetime < 0.0);
    QCOMPARE(stats.uptimeRatio, 0.0);
    QCOMPARE(stats.downtimeRatio, 0.0);
}

void StatisticsTests::testRounding()
{
    QCOMPARE(uptally::roundTo2(1.005000001), 1.01);
    QCOMPARE(uptally::roundTo2(2.344), 2.34);

    const std::vector<uptally::SessionRecord> ledger = {
        closedRecord(1, 1000, 1, 1, uptally::ShutdownKind::Ungraceful),
        openRecord(2, 1002, 1),
    };
    const auto stats = uptally::computeStatistics(ledger);
    QCOMPARE(stats.uptimeRatio, 66.67);
    QCOMPARE(stats.downtimeRatio, 33.33);
}

void StatisticsTests::testEmptyLedger()
{
    const auto stats = uptally::computeStatistics({});
    QCOMPARE(stats.sessionCount, static_cast<int64_t>(0));
    QCOMPARE(stats.uptimeRatio, 0.0);
}

QTEST_MAIN(StatisticsTests)
#include "test_statistics.moc"
