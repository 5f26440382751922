#include "common/shell_config.hpp"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QStandardPaths>

#include "common/unpod_version.hpp"

namespace unpod {

namespace {

RuntimeMode buildDefaultMode()
{
#ifdef UNPOD_DEVELOPMENT_BUILD
    return RuntimeMode::Development;
#else
    return RuntimeMode::Production;
#endif
}

} // namespace

QString runtimeModeName(RuntimeMode mode)
{
    return mode == RuntimeMode::Development
        ? QStringLiteral("development")
        : QStringLiteral("production");
}

ShellConfig ShellConfig::defaults()
{
    ShellConfig config;
    config.appName = QStringLiteral(UNPOD_APP_NAME);
    config.appVersion = QStringLiteral(UNPOD_VERSION);
    config.mode = buildDefaultMode();
    config.platform = currentPlatform();
    config.executableDir = QCoreApplication::applicationDirPath();
    config.resourceDir = defaultResourceDir(config.platform, config.executableDir);
    config.dataDir = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    return config;
}

void ShellConfig::applyEnvironment()
{
    const QString modeValue = qEnvironmentVariable("UNPOD_MODE").toLower();
    if (modeValue == QStringLiteral("development")) {
        mode = RuntimeMode::Development;
    } else if (modeValue == QStringLiteral("production")) {
        mode = RuntimeMode::Production;
    }

    if (qEnvironmentVariableIsSet("UNPOD_RESOURCE_DIR")) {
        resourceDir = qEnvironmentVariable("UNPOD_RESOURCE_DIR");
    }
    if (qEnvironmentVariableIsSet("UNPOD_DATA_DIR")) {
        dataDir = qEnvironmentVariable("UNPOD_DATA_DIR");
    }

    bool ok = false;
    const int port = qEnvironmentVariableIntValue("UNPOD_BACKEND_PORT", &ok);
    if (ok && port > 0 && port <= 65535) {
        backendPort = static_cast<quint16>(port);
    }

    const int settleMs = qEnvironmentVariableIntValue("UNPOD_SETTLE_MS", &ok);
    if (ok && settleMs >= 0) {
        settleInterval = std::chrono::milliseconds(settleMs);
    }

    if (qEnvironmentVariableIsSet("UNPOD_UPDATE_URL")) {
        updateUrl = qEnvironmentVariable("UNPOD_UPDATE_URL");
    }
    if (qEnvironmentVariableIsSet("UNPOD_SOCKET_NAME")) {
        socketName = qEnvironmentVariable("UNPOD_SOCKET_NAME");
    }
    if (qEnvironmentVariableIntValue("UNPOD_TRACE") == 1) {
        traceEnabled = true;
    }
}

void ShellConfig::applyArguments(const QStringList &arguments)
{
    QCommandLineParser parser;
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption devOption(QStringList() << "dev",
                                 "Assume an externally-run backend; do not spawn one.");
    QCommandLineOption productionOption(QStringList() << "production",
                                        "Spawn the bundled backend.");
    QCommandLineOption traceOption(QStringList() << "trace",
                                   "Enable verbose trace logging.");
    QCommandLineOption resourceOption(QStringList() << "resource-dir",
                                      "Bundle resource directory.", "path");
    QCommandLineOption dataOption(QStringList() << "data-dir",
                                  "Directory holding session state.", "path");
    parser.addOption(devOption);
    parser.addOption(productionOption);
    parser.addOption(traceOption);
    parser.addOption(resourceOption);
    parser.addOption(dataOption);

    if (QCoreApplication::instance()) {
        parser.process(arguments);
    } else if (!parser.parse(arguments)) {
        return;
    }

    if (parser.isSet(devOption)) {
        mode = RuntimeMode::Development;
    } else if (parser.isSet(productionOption)) {
        mode = RuntimeMode::Production;
    }
    if (parser.isSet(traceOption)) {
        traceEnabled = true;
    }
    if (parser.isSet(resourceOption)) {
        resourceDir = parser.value(resourceOption);
    }
    if (parser.isSet(dataOption)) {
        dataDir = parser.value(dataOption);
    }
}

} // namespace unpod
