#include "notify/notification_gateway.hpp"

#include <QDir>
#include <QFileInfo>

#include <utility>

#include "common/logging.hpp"

#include <nlohmann/json.hpp>

namespace unpod {

QString permissionName(NotificationPermission permission)
{
    switch (permission) {
    case NotificationPermission::Granted:
        return QStringLiteral("granted");
    case NotificationPermission::Denied:
        return QStringLiteral("denied");
    case NotificationPermission::Unknown:
        return QStringLiteral("unknown");
    }
    return QStringLiteral("unknown");
}

NotificationGateway::NotificationGateway(const ShellConfig &config,
                                         NotificationBackend &backend,
                                         FileExists fileExists)
    : m_config(config)
    , m_backend(backend)
    , m_fileExists(std::move(fileExists))
{
    if (!m_fileExists) {
        m_fileExists = [](const QString &path) { return QFileInfo::exists(path); };
    }
}

NotificationPermission NotificationGateway::queryPermission()
{
    return m_backend.permissionState();
}

bool NotificationGateway::requestPermission()
{
    return m_backend.requestPermission() == NotificationPermission::Granted;
}

QString NotificationGateway::iconPath() const
{
    if (m_config.isDevelopment()) {
        return QStringLiteral("icons/icon.png");
    }
    return QDir(m_config.resourceDir).filePath(QStringLiteral("icons/icon.png"));
}

NotificationResult NotificationGateway::show(const QString &title, const QString &body)
{
    const NotificationPermission permission = m_backend.requestPermission();
    if (permission != NotificationPermission::Granted) {
        ULOG_WARN(QStringLiteral("NotificationGateway"),
                  QStringLiteral("show"),
                  QStringLiteral("notification_denied"),
                  QStringLiteral("permission_request"),
                  QStringLiteral("os_notification"),
                  logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"permission", permissionName(permission).toStdString()}}));
        NotificationResult result;
        result.status = NotificationResult::Status::PermissionDenied;
        result.message = QStringLiteral("Notification permission not granted. State: %1")
            .arg(permissionName(permission));
        return result;
    }

    NotificationRequest request{title, body, std::nullopt};
    QString iconError;

    const QString icon = iconPath();
    if (m_fileExists(icon)) {
        request.icon = icon;
        if (m_backend.display(request, &iconError)) {
            ULOG_DEBUG(QStringLiteral("NotificationGateway"),
                       QStringLiteral("show"),
                       QStringLiteral("notification_shown"),
                       QStringLiteral("client_call"),
                       QStringLiteral("with_icon"),
                       logging::defaultWho(),
                       QString(),
                       (nlohmann::json{{"icon", icon.toStdString()}}));
            NotificationResult result;
            result.usedIcon = true;
            return result;
        }
    } else {
        iconError = QStringLiteral("Icon file not found");
    }

    ULOG_INFO(QStringLiteral("NotificationGateway"),
              QStringLiteral("show"),
              QStringLiteral("notification_icon_fallback"),
              QStringLiteral("icon_unavailable"),
              QStringLiteral("without_icon"),
              logging::defaultWho(),
              QString(),
              (nlohmann::json{{"icon", icon.toStdString()},
                              {"reason", iconError.toStdString()}}));

    request.icon.reset();
    QString plainError;
    if (m_backend.display(request, &plainError)) {
        return NotificationResult{};
    }

    ULOG_ERROR(QStringLiteral("NotificationGateway"),
               QStringLiteral("show"),
               QStringLiteral("notification_failed"),
               QStringLiteral("display_error"),
               QStringLiteral("without_icon"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"error", plainError.toStdString()}}));
    NotificationResult result;
    result.status = NotificationResult::Status::DisplayError;
    result.message = QStringLiteral("Failed to show notification: %1").arg(plainError);
    return result;
}

} // namespace unpod
