#pragma once

#include <QLocalServer>
#include <QLocalSocket>
#include <QObject>

#include <functional>

#include <nlohmann/json.hpp>

namespace unpod {

class ShellCommands;

/**
 * CommandServer exposes ShellCommands to the front-end over a local socket
 * using a minimal JSON-RPC-like protocol, one request per connection:
 *
 *   {"id": 1, "method": "session_get", "params": {"key": "k"}}
 *   -> {"id": 1, "result": "v"} or {"id": 1, "error": "message"}
 *
 * Every failure is reported as an error reply; nothing escapes a request.
 */
class CommandServer : public QObject
{
    Q_OBJECT
public:
    using Reply = std::function<void(const QByteArray &response)>;

    explicit CommandServer(ShellCommands &commands, QObject *parent = nullptr);
    ~CommandServer() override;

    // Listens on socketName, or on $XDG_RUNTIME_DIR/unpod-shell.sock when empty.
    bool start(const QString &socketName);
    QString serverName() const;

    // Processes a single payload without a socket round-trip. reply is
    // invoked exactly once, possibly after the event loop has run.
    void handleRequestPayload(const QByteArray &payload, Reply reply);

    static QString defaultSocketPath();

private slots:
    void handleNewConnection();
    void handleClientReadyRead();

private:
    bool dispatch(const std::string &method,
                  const nlohmann::json &params,
                  qint64 id,
                  const QString &corrId,
                  const Reply &reply);
    QByteArray makeErrorResponse(const QString &message, qint64 id = -1) const;
    QByteArray makeResultResponse(const nlohmann::json &result, qint64 id) const;

    ShellCommands &m_commands;
    QLocalServer m_server;
};

} // namespace unpod
