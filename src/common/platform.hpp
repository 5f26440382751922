#pragma once

#include <QString>
#include <QStringList>

namespace unpod {

// Closed set of platform families the shell is packaged for. Resolved once at
// startup; everything platform-specific below is a pure mapping from it.
enum class PlatformFamily {
    MacOS,
    Windows,
    Linux
};

PlatformFamily currentPlatform();

// OS identifier reported to the front-end: "macos", "windows" or "linux".
QString platformName(PlatformFamily platform);

// Installers place auxiliary binaries in a different directory per platform:
// MacOS    <resourceDir>/../MacOS/node
// Windows  <executableDir>/node.exe
// Linux    <resourceDir>/node
QString runtimeBinaryPath(PlatformFamily platform,
                          const QString &resourceDir,
                          const QString &executableDir);

// Default bundle resource directory relative to the running executable.
QString defaultResourceDir(PlatformFamily platform, const QString &executableDir);

struct TerminateCommand {
    QString program;
    QStringList arguments;
};

// External command used to force-kill a pid. Empty program on POSIX, where the
// signal is delivered directly.
TerminateCommand terminateCommand(PlatformFamily platform, qint64 pid);

} // namespace unpod
