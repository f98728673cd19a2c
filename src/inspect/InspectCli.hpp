#pragma once

#include <QString>
#include <QStringList>

#include "common/config.hpp"

namespace tracedeck {

class InspectCli
{
public:
    explicit InspectCli(const Config &config);

    // CLI dispatcher; returns the process exit code.
    int run(int argc, char *argv[]);

private:
    int runParse(const QStringList &args);
    int runSessions(const QStringList &args);
    int runMessages(const QStringList &args);
    int runUsage(const QStringList &args);

    Config m_config;
};

} // namespace tracedeck
