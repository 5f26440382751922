#pragma once

#include <QString>
#include <QStringList>

#include <chrono>

#include "common/platform.hpp"

namespace unpod {

enum class RuntimeMode {
    Development,
    Production
};

QString runtimeModeName(RuntimeMode mode);

// ShellConfig is assembled once in main() and handed to every component by
// const reference. Tests build it directly.
struct ShellConfig {
    QString appName;
    QString appVersion;
    RuntimeMode mode = RuntimeMode::Production;
    PlatformFamily platform = PlatformFamily::Linux;

    QString executableDir;
    QString resourceDir;
    QString dataDir;

    quint16 backendPort = 3000;
    std::chrono::milliseconds settleInterval{2000};

    QString updateUrl;
    QString socketName;
    bool traceEnabled = false;

    bool isDevelopment() const { return mode == RuntimeMode::Development; }

    // Defaults for the running binary, before environment or flags are applied.
    static ShellConfig defaults();

    // Applies UNPOD_* environment overrides.
    void applyEnvironment();

    // Applies --dev / --production / --trace / --resource-dir / --data-dir.
    void applyArguments(const QStringList &arguments);
};

} // namespace unpod
