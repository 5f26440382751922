#include "tray/ShellTray.hpp"

#include <QAction>
#include <QApplication>
#include <QIcon>
#include <QKeySequence>
#include <QMenuBar>
#include <QWidget>

#include <utility>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/logging.hpp"
#include "shell/update_checker.hpp"
#include "ui/AppWindow.hpp"

namespace unpod {

namespace {

const QString kTrayIconResource = QStringLiteral(":/icons/tray.png");

// Edit actions go to whichever widget holds keyboard focus.
void forwardToFocusWidget(const char *method)
{
    QWidget *target = QApplication::focusWidget();
    if (!target || !QMetaObject::invokeMethod(target, method)) {
        ULOG_DEBUG(QStringLiteral("ShellTray"),
                   QStringLiteral("forwardToFocusWidget"),
                   QStringLiteral("edit_action_unhandled"),
                   QStringLiteral("user_action"),
                   QStringLiteral("menu"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"method", method}}));
    }
}

} // namespace

void BadgeCell::set(int count)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_count = count;
}

int BadgeCell::get() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_count;
}

QString trayTooltipFor(const QString &appName, int count)
{
    if (count <= 0) {
        return appName;
    }
    if (count == 1) {
        return QStringLiteral("%1 - 1 unread notification").arg(appName);
    }
    return QStringLiteral("%1 - %2 unread notifications").arg(appName).arg(count);
}

QString windowTitleFor(const QString &appName, int count)
{
    if (count <= 0) {
        return appName;
    }
    return QStringLiteral("(%1) %2").arg(count).arg(appName);
}

ShellTray::ShellTray(const ShellConfig &config,
                     AppWindow &window,
                     UpdateChecker &updates,
                     QObject *parent)
    : QObject(parent)
    , m_config(config)
    , m_window(window)
    , m_updates(updates)
    , m_trayAvailable(&QSystemTrayIcon::isSystemTrayAvailable)
{
    m_trayIcon.setToolTip(m_config.appName);
}

ShellTray::~ShellTray() = default;

QMenuBar *ShellTray::buildMenu()
{
    auto *bar = new QMenuBar();

    QMenu *fileMenu = bar->addMenu(QStringLiteral("&File"));
    QMenu *editMenu = bar->addMenu(QStringLiteral("&Edit"));
    QMenu *viewMenu = bar->addMenu(QStringLiteral("&View"));
    QMenu *windowMenu = bar->addMenu(QStringLiteral("&Window"));

    QAction *quit = fileMenu->addAction(QStringLiteral("Quit"));
    quit->setShortcut(QKeySequence::Quit);
    connect(quit, &QAction::triggered, this, &ShellTray::quitRequested);

    struct EditEntry {
        const char *label;
        QKeySequence::StandardKey key;
        const char *method;
    };
    const EditEntry history[] = {
        {"Undo", QKeySequence::Undo, "undo"},
        {"Redo", QKeySequence::Redo, "redo"},
    };
    const EditEntry clipboard[] = {
        {"Cut", QKeySequence::Cut, "cut"},
        {"Copy", QKeySequence::Copy, "copy"},
        {"Paste", QKeySequence::Paste, "paste"},
        {"Select All", QKeySequence::SelectAll, "selectAll"},
    };
    const auto addEdit = [editMenu](const EditEntry &entry) {
        QAction *action = editMenu->addAction(QString::fromLatin1(entry.label));
        action->setShortcut(entry.key);
        const char *method = entry.method;
        QObject::connect(action, &QAction::triggered, action, [method]() {
            forwardToFocusWidget(method);
        });
    };
    for (const auto &entry : history) {
        addEdit(entry);
    }
    editMenu->addSeparator();
    for (const auto &entry : clipboard) {
        addEdit(entry);
    }

    QAction *viewMinimize = viewMenu->addAction(QStringLiteral("Minimize"));
    connect(viewMinimize, &QAction::triggered, this, [this]() { m_window.minimizeWindow(); });
    QAction *zoom = viewMenu->addAction(QStringLiteral("Zoom"));
    connect(zoom, &QAction::triggered, this, [this]() {
        if (m_window.isWindowMaximized()) {
            m_window.unmaximizeWindow();
        } else {
            m_window.maximizeWindow();
        }
    });
    viewMenu->addSeparator();
    QAction *fullScreen = viewMenu->addAction(QStringLiteral("Toggle Full Screen"));
    fullScreen->setShortcut(QKeySequence::FullScreen);
    connect(fullScreen, &QAction::triggered, this, [this]() { m_window.toggleFullScreen(); });

    QAction *windowMinimize = windowMenu->addAction(QStringLiteral("Minimize"));
    windowMinimize->setShortcut(QKeySequence(QStringLiteral("Ctrl+M")));
    connect(windowMinimize, &QAction::triggered, this, [this]() { m_window.minimizeWindow(); });
    QAction *windowClose = windowMenu->addAction(QStringLiteral("Close"));
    windowClose->setShortcut(QKeySequence::Close);
    connect(windowClose, &QAction::triggered, this, [this]() { m_window.closeWindow(); });

    m_window.installMenuBar(bar);
    return bar;
}

void ShellTray::buildTray()
{
    if (!m_trayAvailable()) {
        throw ToolkitError("System tray not available");
    }
    setupTrayIcon();
    setupMenu();
    m_trayIcon.show();

    ULOG_INFO(QStringLiteral("ShellTray"),
              QStringLiteral("buildTray"),
              QStringLiteral("tray_ready"),
              QStringLiteral("startup"),
              QStringLiteral("qt_tray"),
              logging::defaultWho(),
              QString(),
              nlohmann::json::object());
}

void ShellTray::setTrayAvailability(TrayAvailability availability)
{
    m_trayAvailable = std::move(availability);
}

void ShellTray::setupTrayIcon()
{
    const QIcon icon(kTrayIconResource);
    if (icon.isNull()) {
        throw ToolkitError("Missing tray icon resource " + kTrayIconResource.toStdString());
    }
    m_trayIcon.setIcon(icon);
    m_trayIcon.setToolTip(trayTooltipFor(m_config.appName, m_badge.get()));

    connect(&m_trayIcon, &QSystemTrayIcon::activated,
            this, &ShellTray::onTrayActivated);
    connect(&m_trayIcon, &QSystemTrayIcon::messageClicked,
            this, &ShellTray::notificationClicked);
}

void ShellTray::setupMenu()
{
    QAction *showAction = m_menu.addAction(QStringLiteral("Show App"));
    connect(showAction, &QAction::triggered, this, &ShellTray::showRequested);

    m_menu.addSeparator();

    QAction *updatesAction = m_menu.addAction(QStringLiteral("Check for Updates"));
    connect(updatesAction, &QAction::triggered, this, &ShellTray::checkForUpdates);

    m_menu.addSeparator();

    QAction *quitAction = m_menu.addAction(QStringLiteral("Quit"));
    connect(quitAction, &QAction::triggered, this, &ShellTray::quitRequested);

    m_trayIcon.setContextMenu(&m_menu);
}

void ShellTray::onTrayActivated(QSystemTrayIcon::ActivationReason reason)
{
    if (reason == QSystemTrayIcon::Trigger) {
        ULOG_INFO(QStringLiteral("ShellTray"),
                  QStringLiteral("onTrayActivated"),
                  QStringLiteral("show_window"),
                  QStringLiteral("tray_click"),
                  QStringLiteral("qt_tray"),
                  logging::defaultWho(),
                  QString(),
                  nlohmann::json::object());
        emit showRequested();
    }
}

void ShellTray::checkForUpdates()
{
    ULOG_INFO(QStringLiteral("ShellTray"),
              QStringLiteral("checkForUpdates"),
              QStringLiteral("check_updates"),
              QStringLiteral("user_action"),
              QStringLiteral("tray_menu"),
              logging::defaultWho(),
              QString(),
              nlohmann::json::object());
    m_updates.checkForUpdates([](const UpdateResult &result) {
        if (result.ok) {
            ULOG_INFO(QStringLiteral("ShellTray"),
                      QStringLiteral("checkForUpdates"),
                      QStringLiteral("check_updates_done"),
                      QStringLiteral("user_action"),
                      QStringLiteral("tray_menu"),
                      logging::defaultWho(),
                      QString(),
                      (nlohmann::json{{"status", result.message.toStdString()}}));
        } else {
            ULOG_WARN(QStringLiteral("ShellTray"),
                      QStringLiteral("checkForUpdates"),
                      QStringLiteral("check_updates_failed"),
                      QStringLiteral("user_action"),
                      QStringLiteral("tray_menu"),
                      logging::defaultWho(),
                      QString(),
                      (nlohmann::json{{"error", result.message.toStdString()}}));
        }
    });
}

void ShellTray::setBadge(int count)
{
    if (count < 0) {
        count = 0;
    }
    m_badge.set(count);

    m_trayIcon.setToolTip(trayTooltipFor(m_config.appName, count));
    m_window.setTitle(windowTitleFor(m_config.appName, count));

    const bool badgeSet = m_window.setBadgeCount(
        count == 0 ? std::nullopt : std::optional<int>(count));
    if (!badgeSet) {
        ULOG_DEBUG(QStringLiteral("ShellTray"),
                   QStringLiteral("setBadge"),
                   QStringLiteral("os_badge_unsupported"),
                   QStringLiteral("client_call"),
                   QStringLiteral("app_badge"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"count", count}}));
    }
}

int ShellTray::badge() const
{
    return m_badge.get();
}

QSystemTrayIcon &ShellTray::trayIcon()
{
    return m_trayIcon;
}

QMenu &ShellTray::trayMenu()
{
    return m_menu;
}

} // namespace unpod
