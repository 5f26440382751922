#include "notify/tray_notification_backend.hpp"

#include <QIcon>

namespace unpod {

namespace {

constexpr int kMessageTimeoutMs = 10000;

} // namespace

TrayNotificationBackend::TrayNotificationBackend(QSystemTrayIcon *trayIcon)
    : m_trayIcon(trayIcon)
{
}

void TrayNotificationBackend::setTrayIcon(QSystemTrayIcon *trayIcon)
{
    m_trayIcon = trayIcon;
}

NotificationPermission TrayNotificationBackend::permissionState()
{
    if (!QSystemTrayIcon::isSystemTrayAvailable()) {
        return NotificationPermission::Denied;
    }
    if (QSystemTrayIcon::supportsMessages()) {
        return NotificationPermission::Granted;
    }
    return NotificationPermission::Unknown;
}

NotificationPermission TrayNotificationBackend::requestPermission()
{
    // Nothing to prompt for; the answer is whatever the desktop offers now.
    return permissionState();
}

bool TrayNotificationBackend::display(const NotificationRequest &request, QString *error)
{
    if (!m_trayIcon) {
        if (error) {
            *error = QStringLiteral("No tray icon to attach the notification to");
        }
        return false;
    }
    if (!m_trayIcon->isVisible()) {
        if (error) {
            *error = QStringLiteral("Tray icon is hidden");
        }
        return false;
    }

    if (request.icon.has_value()) {
        const QIcon icon(*request.icon);
        if (icon.isNull()) {
            if (error) {
                *error = QStringLiteral("Icon could not be loaded: %1").arg(*request.icon);
            }
            return false;
        }
        m_trayIcon->showMessage(request.title, request.body, icon, kMessageTimeoutMs);
        return true;
    }

    m_trayIcon->showMessage(request.title, request.body,
                            QSystemTrayIcon::Information, kMessageTimeoutMs);
    return true;
}

} // namespace unpod
