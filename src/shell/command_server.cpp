#include "shell/command_server.hpp"

#include <chrono>
#include <cstdint>
#include <limits>
#include <optional>
#include <stdexcept>

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QPointer>
#include <QStandardPaths>
#include <QUuid>

#include <unistd.h>

#include "common/logging.hpp"
#include "session/session_store.hpp"
#include "shell/shell_commands.hpp"

namespace unpod {

namespace {

nlohmann::json optionalToJson(const std::optional<std::string> &value)
{
    if (!value.has_value()) {
        return nullptr;
    }
    return *value;
}

std::string requireString(const nlohmann::json &params, const char *name)
{
    const auto it = params.find(name);
    if (it == params.end() || !it->is_string()) {
        throw std::invalid_argument(std::string("Missing ") + name);
    }
    return it->get<std::string>();
}

void logCompleted(const std::string &method,
                  const QString &corrId,
                  std::chrono::steady_clock::time_point start)
{
    ULOG_INFO(QStringLiteral("CommandServer"),
              QStringLiteral("handleRequest"),
              QStringLiteral("command_completed"),
              QStringLiteral("client_call"),
              QStringLiteral("json_rpc"),
              logging::defaultWho(),
              corrId,
              (nlohmann::json{{"method", method},
                             {"durationMs",
                              std::chrono::duration_cast<std::chrono::milliseconds>(
                                  std::chrono::steady_clock::now() - start).count()}}));
}

} // namespace

CommandServer::CommandServer(ShellCommands &commands, QObject *parent)
    : QObject(parent)
    , m_commands(commands)
{
}

CommandServer::~CommandServer() = default;

QString CommandServer::defaultSocketPath()
{
    QString runtimeDir = qEnvironmentVariable("XDG_RUNTIME_DIR");
    if (runtimeDir.isEmpty()) {
        runtimeDir =
            QStandardPaths::writableLocation(QStandardPaths::RuntimeLocation);
    }
    if (runtimeDir.isEmpty()) {
        runtimeDir = QStringLiteral("/run/user/%1").arg(getuid());
    }
    return runtimeDir + QStringLiteral("/unpod-shell.sock");
}

bool CommandServer::start(const QString &socketName)
{
    const QString socketPath = socketName.isEmpty() ? defaultSocketPath() : socketName;
    if (socketPath.contains('/')) {
        const QFileInfo socketInfo(socketPath);
        if (!QDir().mkpath(socketInfo.absolutePath())) {
            ULOG_ERROR(QStringLiteral("CommandServer"),
                       QStringLiteral("start"),
                       QStringLiteral("socket_dir_failed"),
                       QStringLiteral("startup"),
                       QStringLiteral("mkpath"),
                       logging::defaultWho(),
                       QString(),
                       (nlohmann::json{{"dir", socketInfo.absolutePath().toStdString()}}));
            return false;
        }
        if (QFile::exists(socketPath) && !QLocalServer::removeServer(socketPath)) {
            ULOG_ERROR(QStringLiteral("CommandServer"),
                       QStringLiteral("start"),
                       QStringLiteral("stale_socket"),
                       QStringLiteral("startup"),
                       QStringLiteral("remove_server"),
                       logging::defaultWho(),
                       QString(),
                       (nlohmann::json{{"socket", socketPath.toStdString()}}));
            return false;
        }
    } else {
        QLocalServer::removeServer(socketPath);
    }

    if (!m_server.listen(socketPath)) {
        ULOG_ERROR(QStringLiteral("CommandServer"),
                   QStringLiteral("start"),
                   QStringLiteral("listen_failed"),
                   QStringLiteral("startup"),
                   QStringLiteral("qlocalserver"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"socket", socketPath.toStdString()},
                                   {"error", m_server.errorString().toStdString()}}));
        return false;
    }

    connect(&m_server, &QLocalServer::newConnection,
            this, &CommandServer::handleNewConnection);

    ULOG_INFO(QStringLiteral("CommandServer"),
              QStringLiteral("start"),
              QStringLiteral("listening"),
              QStringLiteral("startup"),
              QStringLiteral("qlocalserver"),
              logging::defaultWho(),
              QString(),
              (nlohmann::json{{"socket", m_server.fullServerName().toStdString()}}));
    return true;
}

QString CommandServer::serverName() const
{
    return m_server.fullServerName();
}

void CommandServer::handleNewConnection()
{
    while (m_server.hasPendingConnections()) {
        QLocalSocket *socket = m_server.nextPendingConnection();
        if (!socket) {
            continue;
        }
        connect(socket, &QLocalSocket::readyRead,
                this, &CommandServer::handleClientReadyRead);
        connect(socket, &QLocalSocket::disconnected,
                socket, &QObject::deleteLater);
    }
}

void CommandServer::handleClientReadyRead()
{
    auto *socket = qobject_cast<QLocalSocket *>(sender());
    if (!socket) {
        return;
    }

    const QByteArray payload = socket->readAll();
    if (payload.isEmpty()) {
        return;
    }

    // The reply may arrive after the client hung up.
    QPointer<QLocalSocket> guard(socket);
    handleRequestPayload(payload, [guard](const QByteArray &response) {
        if (!guard) {
            return;
        }
        guard->write(response + '\n');
        guard->flush();
        guard->disconnectFromServer();
    });
}

void CommandServer::handleRequestPayload(const QByteArray &payload, Reply reply)
{
    const QString corrId = QUuid::createUuid().toString(QUuid::WithoutBraces);
    logging::CorrelationScope corrScope(corrId);
    const auto parsed = nlohmann::json::parse(payload.toStdString(), nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        ULOG_WARN(QStringLiteral("CommandServer"),
                  QStringLiteral("handleRequest"),
                  QStringLiteral("command_error"),
                  QStringLiteral("parse_payload"),
                  QStringLiteral("json_parse"),
                  logging::defaultWho(),
                  corrId,
                  nlohmann::json::object());
        reply(makeErrorResponse("Invalid JSON payload"));
        return;
    }

    qint64 id = -1;
    if (parsed.contains("id") && parsed["id"].is_number_integer()) {
        const auto &rawId = parsed["id"];
        if (!rawId.is_number_unsigned()
            || rawId.get<std::uint64_t>()
                   <= static_cast<std::uint64_t>(std::numeric_limits<qint64>::max())) {
            id = rawId.get<qint64>();
        }
    }

    if (!parsed.contains("method") || !parsed["method"].is_string()) {
        ULOG_WARN(QStringLiteral("CommandServer"),
                  QStringLiteral("handleRequest"),
                  QStringLiteral("command_error"),
                  QStringLiteral("missing_method"),
                  QStringLiteral("json_parse"),
                  logging::defaultWho(),
                  corrId,
                  nlohmann::json::object());
        reply(makeErrorResponse("Missing method", id));
        return;
    }

    const std::string method = parsed["method"].get<std::string>();
    nlohmann::json params = nlohmann::json::object();
    if (parsed.contains("params") && !parsed["params"].is_null()) {
        if (!parsed["params"].is_object()) {
            reply(makeErrorResponse("Invalid params", id));
            return;
        }
        params = parsed["params"];
    }

    ULOG_DEBUG(QStringLiteral("CommandServer"),
               QStringLiteral("handleRequest"),
               QStringLiteral("command_received"),
               QStringLiteral("client_call"),
               QStringLiteral("json_rpc"),
               logging::defaultWho(),
               corrId,
               (nlohmann::json{{"method", method}}));

    try {
        if (!dispatch(method, params, id, corrId, reply)) {
            ULOG_WARN(QStringLiteral("CommandServer"),
                      QStringLiteral("handleRequest"),
                      QStringLiteral("command_error"),
                      QStringLiteral("unknown_method"),
                      QStringLiteral("json_rpc"),
                      logging::defaultWho(),
                      corrId,
                      (nlohmann::json{{"method", method}}));
            reply(makeErrorResponse("Unknown method", id));
        }
    } catch (const std::exception &ex) {
        ULOG_ERROR(QStringLiteral("CommandServer"),
                   QStringLiteral("handleRequest"),
                   QStringLiteral("command_error"),
                   QStringLiteral("exception"),
                   QStringLiteral("json_rpc"),
                   logging::defaultWho(),
                   corrId,
                   (nlohmann::json{{"method", method}, {"what", ex.what()}}));
        reply(makeErrorResponse(QString::fromUtf8(ex.what()), id));
    }
}

bool CommandServer::dispatch(const std::string &method,
                             const nlohmann::json &params,
                             qint64 id,
                             const QString &corrId,
                             const Reply &reply)
{
    const auto start = std::chrono::steady_clock::now();
    const auto respond = [&](const nlohmann::json &result) {
        logCompleted(method, corrId, start);
        reply(makeResultResponse(result, id));
    };

    if (method == "session_get_token") {
        respond(optionalToJson(m_commands.session().authToken()));
        return true;
    }
    if (method == "session_set_token") {
        m_commands.session().setAuthToken(requireString(params, "token"));
        respond(true);
        return true;
    }
    if (method == "session_delete_token") {
        m_commands.session().deleteAuthToken();
        respond(true);
        return true;
    }
    if (method == "session_get") {
        respond(optionalToJson(m_commands.session().get(requireString(params, "key"))));
        return true;
    }
    if (method == "session_set") {
        const std::string key = requireString(params, "key");
        m_commands.session().set(key, requireString(params, "value"));
        respond(true);
        return true;
    }
    if (method == "session_delete") {
        m_commands.session().remove(requireString(params, "key"));
        respond(true);
        return true;
    }
    if (method == "session_clear") {
        m_commands.session().clear();
        respond(true);
        return true;
    }

    if (method == "get_platform") {
        respond(m_commands.platform().toStdString());
        return true;
    }
    if (method == "get_app_version") {
        respond(m_commands.appVersion().toStdString());
        return true;
    }
    if (method == "get_theme") {
        respond(m_commands.theme().toStdString());
        return true;
    }

    if (method == "window_minimize") {
        m_commands.minimizeWindow();
        respond(nullptr);
        return true;
    }
    if (method == "window_maximize") {
        m_commands.toggleMaximizeWindow();
        respond(nullptr);
        return true;
    }
    if (method == "window_close") {
        m_commands.closeWindow();
        respond(nullptr);
        return true;
    }
    if (method == "open_external") {
        const QString url = QString::fromStdString(requireString(params, "url"));
        if (!m_commands.openExternal(url)) {
            reply(makeErrorResponse(QStringLiteral("Failed to open %1").arg(url), id));
            return true;
        }
        respond(nullptr);
        return true;
    }

    if (method == "check_notification_permission") {
        respond(permissionName(m_commands.notificationPermission()).toStdString());
        return true;
    }
    if (method == "request_notification_permission") {
        respond(m_commands.requestNotificationPermission());
        return true;
    }
    if (method == "show_notification") {
        const QString title = QString::fromStdString(requireString(params, "title"));
        const QString body = QString::fromStdString(requireString(params, "body"));
        const NotificationResult result = m_commands.showNotification(title, body);
        if (!result.ok()) {
            reply(makeErrorResponse(result.message, id));
            return true;
        }
        respond(nullptr);
        return true;
    }
    if (method == "update_notification_badge") {
        const auto count = params.find("count");
        if (count == params.end() || !count->is_number()) {
            reply(makeErrorResponse("Missing count", id));
            return true;
        }
        // Badge counts are unsigned and must fit the toolkit's int.
        const bool inRange = count->is_number_unsigned()
            ? count->get<std::uint64_t>()
                  <= static_cast<std::uint64_t>(std::numeric_limits<int>::max())
            : count->is_number_integer() && count->get<std::int64_t>() >= 0
                  && count->get<std::int64_t>() <= std::numeric_limits<int>::max();
        if (!inRange) {
            reply(makeErrorResponse("Invalid count", id));
            return true;
        }
        m_commands.updateBadge(count->get<int>());
        respond(nullptr);
        return true;
    }

    if (method == "updater_check_for_updates" || method == "updater_download_and_install") {
        const bool install = method == "updater_download_and_install";
        auto callback = [this, method, corrId, start, id, reply, install](
                            const UpdateResult &result) {
            if (!result.ok) {
                reply(makeErrorResponse(result.message, id));
                return;
            }
            logCompleted(method, corrId, start);
            if (install) {
                reply(makeResultResponse(nullptr, id));
            } else {
                reply(makeResultResponse(result.message.toStdString(), id));
            }
        };
        if (install) {
            m_commands.downloadAndInstall(callback);
        } else {
            m_commands.checkForUpdates(callback);
        }
        return true;
    }

    if (method == "emit_event") {
        const QString name = QString::fromStdString(requireString(params, "name"));
        if (!m_commands.emitEvent(name)) {
            reply(makeErrorResponse(QStringLiteral("Unknown event %1").arg(name), id));
            return true;
        }
        respond(nullptr);
        return true;
    }

    return false;
}

QByteArray CommandServer::makeErrorResponse(const QString &message, qint64 id) const
{
    nlohmann::json response;
    response["error"] = message.toStdString();
    response["id"] = id;
    return QByteArray::fromStdString(response.dump());
}

QByteArray CommandServer::makeResultResponse(const nlohmann::json &result, qint64 id) const
{
    nlohmann::json response;
    response["result"] = result;
    response["id"] = id;
    return QByteArray::fromStdString(response.dump());
}

} // namespace unpod
