#pragma once

#include <QObject>
#include <QThreadPool>

#include <functional>
#include <memory>

#include "backend/backend_supervisor.hpp"
#include "backend/process_control.hpp"
#include "common/shell_config.hpp"
#include "notify/notification_gateway.hpp"
#include "notify/tray_notification_backend.hpp"
#include "session/session_store.hpp"
#include "shell/command_server.hpp"
#include "shell/reactivation_coordinator.hpp"
#include "shell/shell_commands.hpp"
#include "shell/update_checker.hpp"
#include "tray/ShellTray.hpp"

namespace unpod {

class MainWindow;

/**
 * ApplicationController owns every shell component and sequences startup:
 * backend launch on the worker pool, then menu, tray and activation wiring on
 * the GUI thread, then ready(). Shutdown terminates the backend at most once
 * no matter how many exit paths fire.
 */
class ApplicationController : public QObject, public ShellCommands
{
    Q_OBJECT
public:
    using ErrorPresenter = std::function<void(const QString &title, const QString &message)>;

    ApplicationController(const ShellConfig &config,
                          MainWindow &window,
                          std::unique_ptr<ProcessControl> processControl = nullptr,
                          QObject *parent = nullptr);
    ~ApplicationController() override;

    void start();
    void shutdown();

    // Defaults to a modal QMessageBox.
    void setErrorPresenter(ErrorPresenter presenter);

    ShellTray &tray();
    ReactivationCoordinator &coordinator();
    CommandServer &commandServer();
    const ProcessHandleCell &processHandle() const;

    SessionStore &session() override;
    QString platform() const override;
    QString appVersion() const override;
    QString theme() const override;
    void minimizeWindow() override;
    void toggleMaximizeWindow() override;
    void closeWindow() override;
    bool openExternal(const QString &url) override;
    NotificationPermission notificationPermission() override;
    bool requestNotificationPermission() override;
    NotificationResult showNotification(const QString &title, const QString &body) override;
    void updateBadge(int count) override;
    void checkForUpdates(UpdateChecker::Callback callback) override;
    void downloadAndInstall(UpdateChecker::Callback callback) override;
    bool emitEvent(const QString &name) override;

signals:
    void ready();
    // Menu or tray construction failed; the shell cannot run.
    void fatalError(const QString &message);

private:
    void onBackendStarted(const QString &startupError);
    void finishStartup();
    void onCloseRequested();

    const ShellConfig &m_config;
    MainWindow &m_window;

    std::unique_ptr<ProcessControl> m_processControl;
    BackendSupervisor m_supervisor;
    ProcessHandleCell m_handle;

    SessionStore m_session;
    UpdateChecker m_updates;
    ShellTray m_tray;
    TrayNotificationBackend m_notificationBackend;
    NotificationGateway m_notifications;
    ReactivationCoordinator m_coordinator;
    CommandServer m_server;

    ErrorPresenter m_presentError;
    QThreadPool m_pool;
};

} // namespace unpod
