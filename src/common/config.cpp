#include "common/config.hpp"

#include <algorithm>

#include <QString>
#include <QStringList>

namespace uptally {

std::string dataDirPath()
{
    const QString home = qEnvironmentVariable("HOME");
    if (home.isEmpty()) {
        return ".local/share/uptally";
    }
    return (home + QStringLiteral("/.local/share/uptally")).toStdString();
}

std::string defaultDatabasePath()
{
    const QString fromEnv = qEnvironmentVariable("UPTALLY_DB");
    if (!fromEnv.isEmpty()) {
        return fromEnv.toStdString();
    }
    return dataDirPath() + "/uptally.db";
}

bool parseSortFields(const std::string &text, std::vector<SortField> *fields)
{
    std::vector<SortField> parsed;
    const QStringList names = QString::fromStdString(text).split(
        QChar(','), Qt::SkipEmptyParts);
    for (const QString &raw : names) {
        const QString name = raw.trimmed().toLower();
        SortField field;
        if (name == QStringLiteral("uptime") || name == QStringLiteral("u")) {
            field = SortField::Uptime;
        } else if (name == QStringLiteral("end") || name == QStringLiteral("e")) {
            field = SortField::ShutdownKind;
        } else if (name == QStringLiteral("downtime") || name == QStringLiteral("d")) {
            field = SortField::Downtime;
        } else if (name == QStringLiteral("kernel") || name == QStringLiteral("k")) {
            field = SortField::Kernel;
        } else {
            return false;
        }
        if (std::find(parsed.begin(), parsed.end(), field) == parsed.end()) {
            parsed.push_back(field);
        }
    }

    if (fields) {
        *fields = std::move(parsed);
    }
    return true;
}

} // namespace uptally
