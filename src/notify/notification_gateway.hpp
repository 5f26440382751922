#pragma once

#include <QString>

#include <functional>
#include <optional>

#include "common/shell_config.hpp"

namespace unpod {

enum class NotificationPermission {
    Granted,
    Denied,
    Unknown
};

// "granted", "denied" or "unknown".
QString permissionName(NotificationPermission permission);

struct NotificationRequest {
    QString title;
    QString body;
    std::optional<QString> icon;
};

// OS notification capability. Permission is owned by the OS and only observed.
class NotificationBackend {
public:
    virtual ~NotificationBackend() = default;

    virtual NotificationPermission permissionState() = 0;
    virtual NotificationPermission requestPermission() = 0;

    // Returns false and fills error when the alert could not be displayed.
    virtual bool display(const NotificationRequest &request, QString *error) = 0;
};

struct NotificationResult {
    enum class Status {
        Shown,
        PermissionDenied,
        DisplayError
    };

    Status status = Status::Shown;
    bool usedIcon = false;
    QString message;

    bool ok() const { return status == Status::Shown; }
};

/**
 * NotificationGateway negotiates permission and shows alerts with an icon,
 * falling back to a plain alert when the icon is missing or rejected.
 *
 * Permission is re-requested on every show(); a previous denial is never
 * cached locally, the OS decides whether the re-ask has any effect.
 */
class NotificationGateway {
public:
    using FileExists = std::function<bool(const QString &)>;

    NotificationGateway(const ShellConfig &config,
                        NotificationBackend &backend,
                        FileExists fileExists = {});

    NotificationPermission queryPermission();
    bool requestPermission();
    NotificationResult show(const QString &title, const QString &body);

    // icons/icon.png under the working directory in development, under the
    // bundle resources in production.
    QString iconPath() const;

private:
    const ShellConfig &m_config;
    NotificationBackend &m_backend;
    FileExists m_fileExists;
};

} // namespace unpod
