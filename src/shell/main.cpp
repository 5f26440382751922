#include <QApplication>
#include <QIcon>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"
#include "common/unpod_version.hpp"
#include "common/shell_config.hpp"
#include "shell/application_controller.hpp"
#include "ui/MainWindow.hpp"

int main(int argc, char *argv[])
{
    QApplication app(argc, argv);

    // AppDataLocation is derived from the application name.
    QCoreApplication::setApplicationName(QStringLiteral(UNPOD_APP_NAME));
    QCoreApplication::setApplicationVersion(QStringLiteral(UNPOD_VERSION));

    unpod::ShellConfig config = unpod::ShellConfig::defaults();
    config.applyEnvironment();
    config.applyArguments(app.arguments());

    unpod::logging::initLogging(QStringLiteral("unpod-desktop"), config.traceEnabled);
    ULOG_INFO(QStringLiteral("main"),
              QStringLiteral("main"),
              QStringLiteral("shell_start"),
              QStringLiteral("user_start"),
              QStringLiteral("qt_app"),
              unpod::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"mode", unpod::runtimeModeName(config.mode).toStdString()},
                              {"resourceDir", config.resourceDir.toStdString()},
                              {"dataDir", config.dataDir.toStdString()}}));

    app.setWindowIcon(QIcon(QStringLiteral(":/icons/tray.png")));

    unpod::MainWindow window;
    unpod::ApplicationController controller(config, window);

    QObject::connect(&controller, &unpod::ApplicationController::ready,
                     &window, &unpod::MainWindow::show);
    QObject::connect(&controller, &unpod::ApplicationController::fatalError,
                     &app, [](const QString &message) {
                         qCritical("%s", qPrintable(message));
                         QCoreApplication::exit(1);
                     });
    QObject::connect(&app, &QCoreApplication::aboutToQuit,
                     &controller, &unpod::ApplicationController::shutdown);

    controller.start();
    return app.exec();
}
