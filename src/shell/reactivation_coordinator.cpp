#include "shell/reactivation_coordinator.hpp"

#include <QGuiApplication>
#include <QMetaObject>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"
#include "tray/ShellTray.hpp"
#include "ui/MainWindow.hpp"

namespace unpod {

QString activationKindName(ActivationEvent::Kind kind)
{
    switch (kind) {
    case ActivationEvent::Kind::FocusGained:
        return QStringLiteral("focus_gained");
    case ActivationEvent::Kind::NotificationClicked:
        return QStringLiteral("notification_clicked");
    case ActivationEvent::Kind::ShowRequested:
        return QStringLiteral("show_requested");
    case ActivationEvent::Kind::CloseRequested:
        return QStringLiteral("close_requested");
    }
    return QStringLiteral("unknown");
}

ReactivationCoordinator::ReactivationCoordinator(AppWindow &window,
                                                 PlatformFamily platform,
                                                 QObject *parent)
    : QObject(parent)
    , m_window(window)
    , m_platform(platform)
{
}

ReactivationCoordinator::~ReactivationCoordinator() = default;

void ReactivationCoordinator::handle(const ActivationEvent &event)
{
    ULOG_DEBUG(QStringLiteral("ReactivationCoordinator"),
               QStringLiteral("handle"),
               QStringLiteral("activation_event"),
               activationKindName(event.kind),
               QStringLiteral("qt_signal"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"source", event.source.toStdString()}}));

    if (event.kind == ActivationEvent::Kind::CloseRequested) {
        emit closeRequested();
        return;
    }
    activate();
}

void ReactivationCoordinator::post(const ActivationEvent &event)
{
    QMetaObject::invokeMethod(this, [this, event]() { handle(event); },
                              Qt::QueuedConnection);
}

bool ReactivationCoordinator::activate()
{
    bool changed = false;
    if (m_window.isWindowMinimized()) {
        m_window.unminimizeWindow();
        changed = true;
    }
    if (!m_window.isWindowVisible()) {
        m_window.showWindow();
        changed = true;
    }
    if (!m_window.isWindowActive()) {
        m_window.focusWindow();
        if (m_platform == PlatformFamily::MacOS) {
            m_window.promoteApplication();
        }
        changed = true;
    }

    if (changed) {
        ULOG_INFO(QStringLiteral("ReactivationCoordinator"),
                  QStringLiteral("activate"),
                  QStringLiteral("window_activated"),
                  QStringLiteral("activation_event"),
                  QStringLiteral("app_window"),
                  logging::defaultWho(),
                  QString(),
                  nlohmann::json::object());
    }
    return changed;
}

bool ReactivationCoordinator::handleFrontEndEvent(const QString &name)
{
    if (name == QLatin1String("show")) {
        handle({ActivationEvent::Kind::ShowRequested, QStringLiteral("front-end:show")});
        return true;
    }
    if (name == QLatin1String("notification-action")
        || name == QLatin1String("notification")
        || name == QLatin1String("notification://click")) {
        handle({ActivationEvent::Kind::NotificationClicked, name});
        return true;
    }
    return false;
}

void ReactivationCoordinator::wireWindow(MainWindow &window)
{
    connect(&window, &MainWindow::focusGained, this, [this]() {
        handle({ActivationEvent::Kind::FocusGained, QStringLiteral("window")});
    });
    connect(&window, &MainWindow::closeRequested, this, [this]() {
        handle({ActivationEvent::Kind::CloseRequested, QStringLiteral("window")});
    });
}

void ReactivationCoordinator::wireTray(ShellTray &tray)
{
    connect(&tray, &ShellTray::showRequested, this, [this]() {
        handle({ActivationEvent::Kind::ShowRequested, QStringLiteral("tray")});
    });
    connect(&tray, &ShellTray::notificationClicked, this, [this]() {
        handle({ActivationEvent::Kind::NotificationClicked, QStringLiteral("tray-message")});
    });
}

void ReactivationCoordinator::wireApplication(QGuiApplication &app)
{
    connect(&app, &QGuiApplication::applicationStateChanged, this,
            [this](Qt::ApplicationState state) {
                if (state == Qt::ApplicationActive) {
                    handle({ActivationEvent::Kind::FocusGained, QStringLiteral("application")});
                }
            });
}

} // namespace unpod
