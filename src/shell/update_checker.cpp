#include "shell/update_checker.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QProcess>
#include <QSaveFile>
#include <QVersionNumber>

#include <utility>

#include "common/logging.hpp"

#include <nlohmann/json.hpp>

namespace unpod {

namespace {

bool launchInstaller(const QString &artifactPath, QString *error)
{
    QFile::setPermissions(artifactPath,
                          QFile::permissions(artifactPath) | QFileDevice::ExeOwner);
    if (!QProcess::startDetached(artifactPath, {})) {
        if (error) {
            *error = QStringLiteral("Failed to launch installer: %1").arg(artifactPath);
        }
        return false;
    }
    return true;
}

UpdateResult failure(const QString &message)
{
    UpdateResult result;
    result.ok = false;
    result.message = message;
    return result;
}

} // namespace

UpdateChecker::UpdateChecker(const ShellConfig &config, QObject *parent)
    : QObject(parent)
    , m_config(config)
    , m_installer(launchInstaller)
{
}

UpdateChecker::~UpdateChecker() = default;

void UpdateChecker::setInstaller(Installer installer)
{
    m_installer = std::move(installer);
}

bool UpdateChecker::isNewer(const QString &candidate, const QString &current)
{
    const QVersionNumber candidateVersion = QVersionNumber::fromString(candidate);
    const QVersionNumber currentVersion = QVersionNumber::fromString(current);
    if (candidateVersion.isNull()) {
        return false;
    }
    return QVersionNumber::compare(candidateVersion, currentVersion) > 0;
}

std::optional<UpdateInfo> UpdateChecker::parseManifest(const QByteArray &payload,
                                                       PlatformFamily platform,
                                                       QString *error)
{
    const auto parsed = nlohmann::json::parse(payload.toStdString(), nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        if (error) {
            *error = QStringLiteral("Invalid update manifest");
        }
        return std::nullopt;
    }

    const auto version = parsed.find("version");
    if (version == parsed.end() || !version->is_string()) {
        if (error) {
            *error = QStringLiteral("Update manifest has no version");
        }
        return std::nullopt;
    }

    UpdateInfo info;
    info.version = QString::fromStdString(version->get<std::string>());
    if (info.version.startsWith(QLatin1Char('v'))) {
        info.version.remove(0, 1);
    }
    info.notes = QString::fromStdString(parsed.value("notes", ""));

    std::string url = parsed.value("url", "");
    const auto platforms = parsed.find("platforms");
    if (platforms != parsed.end() && platforms->is_object()) {
        const auto entry = platforms->find(platformName(platform).toStdString());
        if (entry != platforms->end() && entry->is_object()) {
            url = entry->value("url", url);
        }
    }
    info.artifactUrl = QUrl(QString::fromStdString(url));
    return info;
}

bool UpdateChecker::rejectIfDisabled(const Callback &callback) const
{
    if (m_config.isDevelopment()) {
        callback(failure(QStringLiteral("Auto-updates disabled in development")));
        return true;
    }
    if (m_config.updateUrl.isEmpty()) {
        callback(failure(QStringLiteral("Update endpoint not configured")));
        return true;
    }
    return false;
}

void UpdateChecker::fetchLatest(ManifestCallback callback)
{
    QNetworkRequest request{QUrl(m_config.updateUrl)};
    request.setRawHeader("Accept", "application/json");
    QNetworkReply *reply = m_network.get(request);

    connect(reply, &QNetworkReply::finished, this, [this, reply, callback]() {
        reply->deleteLater();
        if (reply->error() != QNetworkReply::NoError) {
            callback(std::nullopt, reply->errorString());
            return;
        }

        QString parseError;
        const auto update = parseManifest(reply->readAll(), m_config.platform, &parseError);
        if (!update.has_value()) {
            callback(std::nullopt, parseError);
            return;
        }
        if (!isNewer(update->version, m_config.appVersion)) {
            callback(std::nullopt, QString());
            return;
        }
        callback(update, QString());
    });
}

void UpdateChecker::checkForUpdates(Callback callback)
{
    if (rejectIfDisabled(callback)) {
        return;
    }

    fetchLatest([callback](std::optional<UpdateInfo> update, const QString &error) {
        if (!error.isEmpty()) {
            ULOG_WARN(QStringLiteral("UpdateChecker"),
                      QStringLiteral("checkForUpdates"),
                      QStringLiteral("update_check_failed"),
                      QStringLiteral("client_call"),
                      QStringLiteral("http_manifest"),
                      logging::defaultWho(),
                      QString(),
                      (nlohmann::json{{"error", error.toStdString()}}));
            callback(failure(error));
            return;
        }

        UpdateResult result;
        result.ok = true;
        if (update.has_value()) {
            result.message = QStringLiteral("Update available: %1").arg(update->version);
            result.update = update;
        } else {
            result.message = QStringLiteral("No update available");
        }
        ULOG_INFO(QStringLiteral("UpdateChecker"),
                  QStringLiteral("checkForUpdates"),
                  QStringLiteral("update_check_completed"),
                  QStringLiteral("client_call"),
                  QStringLiteral("http_manifest"),
                  logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"status", result.message.toStdString()}}));
        callback(result);
    });
}

void UpdateChecker::downloadAndInstall(Callback callback)
{
    if (rejectIfDisabled(callback)) {
        return;
    }

    fetchLatest([this, callback](std::optional<UpdateInfo> update, const QString &error) {
        if (!error.isEmpty()) {
            callback(failure(error));
            return;
        }
        if (!update.has_value()) {
            UpdateResult result;
            result.ok = true;
            result.message = QStringLiteral("No update available");
            callback(result);
            return;
        }
        if (!update->artifactUrl.isValid() || update->artifactUrl.isEmpty()) {
            callback(failure(QStringLiteral("Update manifest has no artifact for %1")
                                 .arg(platformName(m_config.platform))));
            return;
        }

        ULOG_INFO(QStringLiteral("UpdateChecker"),
                  QStringLiteral("downloadAndInstall"),
                  QStringLiteral("update_download_started"),
                  QStringLiteral("client_call"),
                  QStringLiteral("http_artifact"),
                  logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"version", update->version.toStdString()},
                                  {"url", update->artifactUrl.toString().toStdString()}}));

        const UpdateInfo info = *update;
        QNetworkReply *reply = m_network.get(QNetworkRequest(info.artifactUrl));
        connect(reply, &QNetworkReply::finished, this, [this, info, reply, callback]() {
            reply->deleteLater();
            installArtifact(info, reply, callback);
        });
    });
}

void UpdateChecker::installArtifact(const UpdateInfo &update,
                                    QNetworkReply *reply,
                                    const Callback &callback)
{
    if (reply->error() != QNetworkReply::NoError) {
        callback(failure(reply->errorString()));
        return;
    }

    const QString updatesDir = QDir(m_config.dataDir).filePath(QStringLiteral("updates"));
    if (!QDir().mkpath(updatesDir)) {
        callback(failure(QStringLiteral("Failed to create %1").arg(updatesDir)));
        return;
    }

    QString fileName = QFileInfo(update.artifactUrl.path()).fileName();
    if (fileName.isEmpty()) {
        fileName = QStringLiteral("unpod-%1").arg(update.version);
    }
    const QString artifactPath = QDir(updatesDir).filePath(fileName);

    QSaveFile file(artifactPath);
    if (!file.open(QIODevice::WriteOnly)) {
        callback(failure(file.errorString()));
        return;
    }
    file.write(reply->readAll());
    if (!file.commit()) {
        callback(failure(file.errorString()));
        return;
    }

    QString installError;
    if (!m_installer(artifactPath, &installError)) {
        ULOG_ERROR(QStringLiteral("UpdateChecker"),
                   QStringLiteral("installArtifact"),
                   QStringLiteral("update_install_failed"),
                   QStringLiteral("client_call"),
                   QStringLiteral("installer_hook"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"artifact", artifactPath.toStdString()},
                                   {"error", installError.toStdString()}}));
        callback(failure(installError));
        return;
    }

    UpdateResult result;
    result.ok = true;
    result.message = QStringLiteral("Update %1 installed").arg(update.version);
    result.update = update;
    callback(result);
}

} // namespace unpod
