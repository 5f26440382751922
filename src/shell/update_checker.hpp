#pragma once

#include <QNetworkAccessManager>
#include <QObject>
#include <QString>
#include <QUrl>

#include <functional>
#include <optional>

#include "common/shell_config.hpp"

class QNetworkReply;

namespace unpod {

struct UpdateInfo {
    QString version;
    QString notes;
    QUrl artifactUrl;
};

struct UpdateResult {
    bool ok = false;
    QString message;
    std::optional<UpdateInfo> update;
};

/**
 * UpdateChecker implements the "check version" and "download and apply"
 * hooks against a JSON manifest:
 *
 *   {"version": "1.4.0", "notes": "...",
 *    "platforms": {"linux": {"url": "..."}, "macos": {...}, "windows": {...}},
 *    "url": "<fallback artifact>"}
 *
 * Requests run on QNetworkAccessManager and complete on the event loop; the
 * callback is always invoked exactly once. Artifact verification belongs to
 * the installer the artifact is handed to. Disabled in development.
 */
class UpdateChecker : public QObject
{
    Q_OBJECT
public:
    using Callback = std::function<void(const UpdateResult &)>;
    using Installer = std::function<bool(const QString &artifactPath, QString *error)>;

    explicit UpdateChecker(const ShellConfig &config, QObject *parent = nullptr);
    ~UpdateChecker() override;

    void checkForUpdates(Callback callback);
    void downloadAndInstall(Callback callback);

    // Replaces the default installer, which launches the artifact detached.
    void setInstaller(Installer installer);

    static std::optional<UpdateInfo> parseManifest(const QByteArray &payload,
                                                   PlatformFamily platform,
                                                   QString *error);
    static bool isNewer(const QString &candidate, const QString &current);

private:
    using ManifestCallback =
        std::function<void(std::optional<UpdateInfo> update, const QString &error)>;

    bool rejectIfDisabled(const Callback &callback) const;
    void fetchLatest(ManifestCallback callback);
    void installArtifact(const UpdateInfo &update, QNetworkReply *reply, const Callback &callback);

    const ShellConfig &m_config;
    QNetworkAccessManager m_network;
    Installer m_installer;
};

} // namespace unpod
