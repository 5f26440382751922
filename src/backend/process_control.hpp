#pragma once

#include <QHash>
#include <QString>
#include <QStringList>

#include <memory>
#include <optional>

#include "common/platform.hpp"

namespace unpod {

struct LaunchSpec {
    QString program;
    QStringList arguments;
    QString workingDirectory;
    // Added on top of the inherited environment.
    QHash<QString, QString> environment;
};

// ProcessControl is the OS seam of the backend supervisor: filesystem
// existence checks, detached spawning and forceful termination.
class ProcessControl {
public:
    virtual ~ProcessControl() = default;

    virtual bool exists(const QString &path) const = 0;

    // Launches detached with stdin/stdout/stderr bound to the null device.
    // Returns the child pid, or nullopt when the OS rejects the launch.
    virtual std::optional<qint64> spawnDetached(const LaunchSpec &spec) = 0;

    // Forceful termination. Returns false when the pid could not be killed.
    virtual bool terminate(qint64 pid) = 0;

    static std::unique_ptr<ProcessControl> create(PlatformFamily platform);
};

} // namespace unpod
