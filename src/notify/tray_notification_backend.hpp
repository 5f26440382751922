#pragma once

#include <QPointer>
#include <QSystemTrayIcon>

#include "notify/notification_gateway.hpp"

namespace unpod {

// Displays alerts as tray balloon messages. Qt exposes no permission prompt
// for these, so the state is derived from what the desktop supports.
class TrayNotificationBackend : public NotificationBackend {
public:
    explicit TrayNotificationBackend(QSystemTrayIcon *trayIcon = nullptr);

    void setTrayIcon(QSystemTrayIcon *trayIcon);

    NotificationPermission permissionState() override;
    NotificationPermission requestPermission() override;
    bool display(const NotificationRequest &request, QString *error) override;

private:
    QPointer<QSystemTrayIcon> m_trayIcon;
};

} // namespace unpod
