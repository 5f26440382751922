#pragma once

#include <QString>

#include "notify/notification_gateway.hpp"
#include "shell/update_checker.hpp"

namespace unpod {

class SessionStore;

// Operations the front-end may invoke. ApplicationController is the shipped
// implementation; CommandServer only decodes requests and encodes replies.
class ShellCommands {
public:
    virtual ~ShellCommands() = default;

    virtual SessionStore &session() = 0;

    virtual QString platform() const = 0;
    virtual QString appVersion() const = 0;
    virtual QString theme() const = 0;

    virtual void minimizeWindow() = 0;
    // Maximizes, or restores an already maximized window.
    virtual void toggleMaximizeWindow() = 0;
    virtual void closeWindow() = 0;
    virtual bool openExternal(const QString &url) = 0;

    virtual NotificationPermission notificationPermission() = 0;
    virtual bool requestNotificationPermission() = 0;
    virtual NotificationResult showNotification(const QString &title, const QString &body) = 0;
    virtual void updateBadge(int count) = 0;

    virtual void checkForUpdates(UpdateChecker::Callback callback) = 0;
    virtual void downloadAndInstall(UpdateChecker::Callback callback) = 0;

    // Front-end event by name. Returns false for names nothing listens to.
    virtual bool emitEvent(const QString &name) = 0;
};

} // namespace unpod
