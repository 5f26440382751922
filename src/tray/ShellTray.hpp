#pragma once

#include <QMenu>
#include <QObject>
#include <QSystemTrayIcon>

#include <functional>
#include <mutex>

#include "common/shell_config.hpp"

class QMenuBar;

namespace unpod {

class AppWindow;
class UpdateChecker;

// Lock-guarded unread count shared by the tray, the window and the command
// surface.
class BadgeCell {
public:
    void set(int count);
    int get() const;

private:
    mutable std::mutex m_mutex;
    int m_count = 0;
};

// "<app>" when count is 0, "<app> - N unread notification(s)" otherwise.
QString trayTooltipFor(const QString &appName, int count);
// "<app>" when count is 0, "(N) <app>" otherwise.
QString windowTitleFor(const QString &appName, int count);

// ShellTray owns the tray icon and builds the application menu bar.
class ShellTray : public QObject
{
    Q_OBJECT
public:
    ShellTray(const ShellConfig &config,
              AppWindow &window,
              UpdateChecker &updates,
              QObject *parent = nullptr);
    ~ShellTray() override;

    using TrayAvailability = std::function<bool()>;

    QMenuBar *buildMenu();
    // Throws ToolkitError when no tray is available or the icon is missing.
    void buildTray();
    // Defaults to QSystemTrayIcon::isSystemTrayAvailable.
    void setTrayAvailability(TrayAvailability availability);

    // Tooltip, window title and OS badge are updated independently; the badge
    // is best-effort.
    void setBadge(int count);
    int badge() const;

    QSystemTrayIcon &trayIcon();
    QMenu &trayMenu();

signals:
    void showRequested();
    void quitRequested();
    void notificationClicked();

public slots:
    void onTrayActivated(QSystemTrayIcon::ActivationReason reason);
    void checkForUpdates();

private:
    const ShellConfig &m_config;
    AppWindow &m_window;
    UpdateChecker &m_updates;

    QSystemTrayIcon m_trayIcon;
    QMenu m_menu;
    BadgeCell m_badge;
    TrayAvailability m_trayAvailable;

    void setupTrayIcon();
    void setupMenu();
};

} // namespace unpod
