#pragma once

#include <functional>
#include <memory>

#include <QStringList>

#include "common/config.hpp"
#include "common/models.hpp"

namespace uptally {

class SessionStore;

class UptallyCli
{
public:
    using ObservationProvider = std::function<Observation()>;

    // Reads the running system through /proc and uname.
    UptallyCli();
    explicit UptallyCli(ObservationProvider observe);

    // Records the current boot and prints the requested report.
    // Returns 0 on success, 1 on usage or generic errors, 2 when a
    // restart could not be recorded.
    int run(int argc, char *argv[]);

private:
    bool parseArguments(const QStringList &args, LedgerConfig *config, bool *helpRequested) const;
    int execute(const LedgerConfig &config);

    std::unique_ptr<SessionStore> openStore(const LedgerConfig &config) const;

    ObservationProvider m_observe;
};

} // namespace uptally
