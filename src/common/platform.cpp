#include "common/platform.hpp"

#include <QDir>

namespace unpod {

PlatformFamily currentPlatform()
{
#if defined(Q_OS_MACOS)
    return PlatformFamily::MacOS;
#elif defined(Q_OS_WIN)
    return PlatformFamily::Windows;
#else
    return PlatformFamily::Linux;
#endif
}

QString platformName(PlatformFamily platform)
{
    switch (platform) {
    case PlatformFamily::MacOS:
        return QStringLiteral("macos");
    case PlatformFamily::Windows:
        return QStringLiteral("windows");
    case PlatformFamily::Linux:
        return QStringLiteral("linux");
    }
    return QStringLiteral("linux");
}

QString runtimeBinaryPath(PlatformFamily platform,
                          const QString &resourceDir,
                          const QString &executableDir)
{
    switch (platform) {
    case PlatformFamily::MacOS:
        return QDir::cleanPath(resourceDir + QStringLiteral("/../MacOS/node"));
    case PlatformFamily::Windows:
        return QDir::cleanPath(executableDir + QStringLiteral("/node.exe"));
    case PlatformFamily::Linux:
        return QDir::cleanPath(resourceDir + QStringLiteral("/node"));
    }
    return QDir::cleanPath(resourceDir + QStringLiteral("/node"));
}

QString defaultResourceDir(PlatformFamily platform, const QString &executableDir)
{
    switch (platform) {
    case PlatformFamily::MacOS:
        return QDir::cleanPath(executableDir + QStringLiteral("/../Resources"));
    case PlatformFamily::Windows:
        return QDir::cleanPath(executableDir);
    case PlatformFamily::Linux:
        return QDir::cleanPath(executableDir + QStringLiteral("/../lib/unpod"));
    }
    return QDir::cleanPath(executableDir);
}

TerminateCommand terminateCommand(PlatformFamily platform, qint64 pid)
{
    if (platform == PlatformFamily::Windows) {
        return {QStringLiteral("taskkill"),
                {QStringLiteral("/PID"), QString::number(pid), QStringLiteral("/F")}};
    }
    return {};
}

} // namespace unpod
