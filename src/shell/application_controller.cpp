#include "shell/application_controller.hpp"

#include <QApplication>
#include <QDesktopServices>
#include <QDir>
#include <QMessageBox>
#include <QMetaObject>
#include <QUrl>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/logging.hpp"
#include "ui/MainWindow.hpp"

namespace unpod {

namespace {

constexpr int kWorkerThreads = 2;

std::string sessionDbPath(const ShellConfig &config)
{
    return QDir(config.dataDir).filePath(QStringLiteral("session.db")).toStdString();
}

} // namespace

ApplicationController::ApplicationController(const ShellConfig &config,
                                             MainWindow &window,
                                             std::unique_ptr<ProcessControl> processControl,
                                             QObject *parent)
    : QObject(parent)
    , m_config(config)
    , m_window(window)
    , m_processControl(processControl ? std::move(processControl)
                                      : ProcessControl::create(config.platform))
    , m_supervisor(config, *m_processControl)
    , m_session(sessionDbPath(config))
    , m_updates(config)
    , m_tray(config, window, m_updates)
    , m_notificationBackend(&m_tray.trayIcon())
    , m_notifications(config, m_notificationBackend)
    , m_coordinator(window, config.platform)
    , m_server(*this)
{
    m_pool.setMaxThreadCount(kWorkerThreads);
    m_presentError = [this](const QString &title, const QString &message) {
        QMessageBox::critical(&m_window, title, message);
    };
}

ApplicationController::~ApplicationController()
{
    m_pool.waitForDone();
}

void ApplicationController::setErrorPresenter(ErrorPresenter presenter)
{
    m_presentError = std::move(presenter);
}

void ApplicationController::start()
{
    ULOG_INFO(QStringLiteral("ApplicationController"),
              QStringLiteral("start"),
              QStringLiteral("shell_start"),
              QStringLiteral("user_start"),
              QStringLiteral("qt_app"),
              logging::defaultWho(),
              QString(),
              (nlohmann::json{{"mode", runtimeModeName(m_config.mode).toStdString()},
                              {"platform", platformName(m_config.platform).toStdString()},
                              {"version", m_config.appVersion.toStdString()}}));

    // The launch blocks for the settle interval; keep it off the GUI thread.
    m_pool.start([this]() {
        QString startupError;
        try {
            m_handle.store(m_supervisor.start());
        } catch (const StartupError &ex) {
            startupError = QString::fromUtf8(ex.what());
            ULOG_ERROR(QStringLiteral("ApplicationController"),
                       QStringLiteral("start"),
                       QStringLiteral("backend_start_failed"),
                       QString::fromLatin1(startupErrorKindName(ex.kind())),
                       QStringLiteral("process_start"),
                       logging::defaultWho(),
                       QString(),
                       (nlohmann::json{{"error", ex.what()}}));
        }
        QMetaObject::invokeMethod(this, [this, startupError]() {
            onBackendStarted(startupError);
        }, Qt::QueuedConnection);
    });
}

void ApplicationController::onBackendStarted(const QString &startupError)
{
    if (!startupError.isEmpty() && !m_config.isDevelopment()) {
        m_presentError(QStringLiteral("Server Start Error"),
                       QStringLiteral("Failed to start server: %1").arg(startupError));
    }

    try {
        finishStartup();
    } catch (const ToolkitError &ex) {
        ULOG_ERROR(QStringLiteral("ApplicationController"),
                   QStringLiteral("onBackendStarted"),
                   QStringLiteral("toolkit_setup_failed"),
                   QStringLiteral("startup"),
                   QStringLiteral("qt_widgets"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"error", ex.what()}}));
        emit fatalError(QString::fromUtf8(ex.what()));
        return;
    }

    ULOG_INFO(QStringLiteral("ApplicationController"),
              QStringLiteral("onBackendStarted"),
              QStringLiteral("shell_ready"),
              QStringLiteral("startup"),
              QStringLiteral("qt_app"),
              logging::defaultWho(),
              QString(),
              (nlohmann::json{{"backend", startupError.isEmpty()},
                              {"socket", m_server.serverName().toStdString()}}));
    emit ready();
}

void ApplicationController::finishStartup()
{
    m_tray.buildMenu();
    m_tray.buildTray();
    m_tray.setBadge(0);

    m_coordinator.wireWindow(m_window);
    m_coordinator.wireTray(m_tray);
    if (auto *app = qobject_cast<QGuiApplication *>(QCoreApplication::instance())) {
        m_coordinator.wireApplication(*app);
    }
    connect(&m_coordinator, &ReactivationCoordinator::closeRequested,
            this, &ApplicationController::onCloseRequested);
    connect(&m_tray, &ShellTray::quitRequested,
            qApp, &QCoreApplication::quit);

    if (!m_server.start(m_config.socketName)) {
        // The window still renders; only front-end commands are lost.
        ULOG_WARN(QStringLiteral("ApplicationController"),
                  QStringLiteral("finishStartup"),
                  QStringLiteral("command_server_unavailable"),
                  QStringLiteral("startup"),
                  QStringLiteral("qlocalserver"),
                  logging::defaultWho(),
                  QString(),
                  nlohmann::json::object());
    }

    m_window.setStatusText(QStringLiteral("Connecting to http://localhost:%1")
                               .arg(m_config.backendPort));
}

void ApplicationController::onCloseRequested()
{
    shutdown();
}

void ApplicationController::shutdown()
{
    // A launch still settling has not stored its handle yet.
    m_pool.waitForDone();

    const auto handle = m_handle.take();
    if (!handle.has_value()) {
        return;
    }
    ULOG_INFO(QStringLiteral("ApplicationController"),
              QStringLiteral("shutdown"),
              QStringLiteral("shell_shutdown"),
              QStringLiteral("user_exit"),
              QStringLiteral("process_kill"),
              logging::defaultWho(),
              QString(),
              (nlohmann::json{{"pid", handle->pid}}));
    m_supervisor.stop(*handle);
}

ShellTray &ApplicationController::tray()
{
    return m_tray;
}

ReactivationCoordinator &ApplicationController::coordinator()
{
    return m_coordinator;
}

CommandServer &ApplicationController::commandServer()
{
    return m_server;
}

const ProcessHandleCell &ApplicationController::processHandle() const
{
    return m_handle;
}

SessionStore &ApplicationController::session()
{
    return m_session;
}

QString ApplicationController::platform() const
{
    return platformName(m_config.platform);
}

QString ApplicationController::appVersion() const
{
    return m_config.appVersion;
}

QString ApplicationController::theme() const
{
    return QStringLiteral("light");
}

void ApplicationController::minimizeWindow()
{
    m_window.minimizeWindow();
}

void ApplicationController::toggleMaximizeWindow()
{
    if (m_window.isWindowMaximized()) {
        m_window.unmaximizeWindow();
    } else {
        m_window.maximizeWindow();
    }
}

void ApplicationController::closeWindow()
{
    m_window.closeWindow();
}

bool ApplicationController::openExternal(const QString &url)
{
    const QUrl target(url);
    if (!target.isValid() || target.scheme().isEmpty()) {
        return false;
    }
    return QDesktopServices::openUrl(target);
}

NotificationPermission ApplicationController::notificationPermission()
{
    return m_notifications.queryPermission();
}

bool ApplicationController::requestNotificationPermission()
{
    return m_notifications.requestPermission();
}

NotificationResult ApplicationController::showNotification(const QString &title,
                                                           const QString &body)
{
    return m_notifications.show(title, body);
}

void ApplicationController::updateBadge(int count)
{
    m_tray.setBadge(count);
}

void ApplicationController::checkForUpdates(UpdateChecker::Callback callback)
{
    m_updates.checkForUpdates(std::move(callback));
}

void ApplicationController::downloadAndInstall(UpdateChecker::Callback callback)
{
    m_updates.downloadAndInstall(std::move(callback));
}

bool ApplicationController::emitEvent(const QString &name)
{
    return m_coordinator.handleFrontEndEvent(name);
}

} // namespace unpod
