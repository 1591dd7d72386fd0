#include <QCoreApplication>

#include "cli/UptallyCli.hpp"
#include "common/logging.hpp"

#include <nlohmann/json.hpp>

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("uptally"));

    bool trace = qEnvironmentVariableIntValue("UPTALLY_TRACE") == 1;
    QStringList filteredArgs;
    filteredArgs.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        const QString arg = QString::fromLocal8Bit(argv[i]);
        if (arg == QStringLiteral("--trace")) {
            trace = true;
            continue;
        }
        filteredArgs.push_back(arg);
    }
    uptally::logging::initLogging(QStringLiteral("uptally"), trace);
    ULOG_DEBUG(QStringLiteral("main"),
               QStringLiteral("main"),
               QStringLiteral("uptally_start"),
               (nlohmann::json{{"args", filteredArgs.size()}}));

    uptally::UptallyCli cli;
    std::vector<QByteArray> localArgs;
    std::vector<char *> rawArgs;
    for (const QString &arg : filteredArgs) {
        localArgs.push_back(arg.toLocal8Bit());
    }
    for (auto &arg : localArgs) {
        rawArgs.push_back(arg.data());
    }
    return cli.run(static_cast<int>(rawArgs.size()), rawArgs.data());
}
