#include <QtTest/QtTest>

#include <QFile>
#include <QLocalSocket>
#include <QTemporaryDir>
#include <QTimer>

#include <memory>
#include <optional>

#include <nlohmann/json.hpp>

#include "session/session_store.hpp"
#include "shell/command_server.hpp"
#include "shell/shell_commands.hpp"

namespace {

class FakeShellCommands : public unpod::ShellCommands {
public:
    explicit FakeShellCommands(const std::string &dbPath)
        : store(dbPath)
    {
    }

    unpod::SessionStore &session() override { return store; }

    QString platform() const override { return QStringLiteral("linux"); }
    QString appVersion() const override { return QStringLiteral("1.4.2"); }
    QString theme() const override { return QStringLiteral("light"); }

    void minimizeWindow() override { calls << QStringLiteral("minimize"); }
    void toggleMaximizeWindow() override { calls << QStringLiteral("maximize"); }
    void closeWindow() override { calls << QStringLiteral("close"); }
    bool openExternal(const QString &url) override
    {
        calls << QStringLiteral("open:") + url;
        return url.startsWith(QStringLiteral("https://"));
    }

    unpod::NotificationPermission notificationPermission() override { return permission; }
    bool requestNotificationPermission() override
    {
        return permission == unpod::NotificationPermission::Granted;
    }
    unpod::NotificationResult showNotification(const QString &title, const QString &) override
    {
        calls << QStringLiteral("notify:") + title;
        unpod::NotificationResult result;
        if (permission != unpod::NotificationPermission::Granted) {
            result.status = unpod::NotificationResult::Status::PermissionDenied;
            result.message = QStringLiteral("Notification permission not granted. State: denied");
        }
        return result;
    }
    void updateBadge(int count) override { badge = count; }

    void checkForUpdates(unpod::UpdateChecker::Callback callback) override
    {
        // Completes on a later event loop turn, like a network reply.
        QTimer::singleShot(0, [callback]() {
            unpod::UpdateResult result;
            result.ok = true;
            result.message = QStringLiteral("Update available: 2.0.0");
            callback(result);
        });
    }
    void downloadAndInstall(unpod::UpdateChecker::Callback callback) override
    {
        unpod::UpdateResult result;
        result.message = QStringLiteral("Auto-updates disabled in development");
        callback(result);
    }

    bool emitEvent(const QString &name) override
    {
        events << name;
        return name == QStringLiteral("show");
    }

    unpod::SessionStore store;
    unpod::NotificationPermission permission = unpod::NotificationPermission::Granted;
    std::optional<int> badge;
    QStringList calls;
    QStringList events;
};

} // namespace

class CommandServerTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void init();
    void cleanup();

    void testSessionCommands();
    void testAuthTokenCommands();
    void testSystemInfo();
    void testWindowCommands();
    void testNotificationCommands();
    void testAsyncUpdateReply();
    void testUpdateErrorReply();
    void testEmitEvent();
    void testMalformedRequests();
    void testPersistenceErrorBecomesReply();
    void testSocketRoundTrip();

private:
    QTemporaryDir m_tempDir;
    int m_counter = 0;
    std::unique_ptr<FakeShellCommands> m_commands;
    std::unique_ptr<unpod::CommandServer> m_server;

    nlohmann::json call(const std::string &method,
                        const nlohmann::json &params = nlohmann::json::object());
    nlohmann::json callRaw(const QByteArray &payload);
};

void CommandServerTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
}

void CommandServerTests::init()
{
    const QString dbPath = m_tempDir.filePath(QStringLiteral("session-%1.db").arg(++m_counter));
    m_commands = std::make_unique<FakeShellCommands>(dbPath.toStdString());
    m_server = std::make_unique<unpod::CommandServer>(*m_commands);
}

void CommandServerTests::cleanup()
{
    m_server.reset();
    m_commands.reset();
}

nlohmann::json CommandServerTests::callRaw(const QByteArray &payload)
{
    std::optional<QByteArray> response;
    m_server->handleRequestPayload(payload, [&response](const QByteArray &reply) {
        response = reply;
    });
    if (!response.has_value()) {
        return nlohmann::json();
    }
    return nlohmann::json::parse(response->toStdString(), nullptr, false);
}

nlohmann::json CommandServerTests::call(const std::string &method, const nlohmann::json &params)
{
    const nlohmann::json request = {{"id", 7}, {"method", method}, {"params", params}};
    return callRaw(QByteArray::fromStdString(request.dump()));
}

void CommandServerTests::testSessionCommands()
{
    QVERIFY(call("session_get", {{"key", "theme"}})["result"].is_null());

    const auto set = call("session_set", {{"key", "theme"}, {"value", "dark"}});
    QCOMPARE(set["id"].get<int>(), 7);
    QVERIFY(set["result"].get<bool>());

    QCOMPARE(QString::fromStdString(call("session_get", {{"key", "theme"}})["result"].get<std::string>()),
             QStringLiteral("dark"));
    QCOMPARE(QString::fromStdString(m_commands->store.get("theme").value_or("")),
             QStringLiteral("dark"));

    QVERIFY(call("session_delete", {{"key", "theme"}})["result"].get<bool>());
    QVERIFY(call("session_get", {{"key", "theme"}})["result"].is_null());

    call("session_set", {{"key", "a"}, {"value", "1"}});
    call("session_set_token", {{"token", "t"}});
    QVERIFY(call("session_clear")["result"].get<bool>());
    QVERIFY(call("session_get", {{"key", "a"}})["result"].is_null());
    QVERIFY(call("session_get_token")["result"].is_null());
}

void CommandServerTests::testAuthTokenCommands()
{
    QVERIFY(call("session_get_token")["result"].is_null());
    QVERIFY(call("session_set_token", {{"token", "abc123"}})["result"].get<bool>());
    QCOMPARE(QString::fromStdString(call("session_get_token")["result"].get<std::string>()),
             QStringLiteral("abc123"));
    QVERIFY(call("session_delete_token")["result"].get<bool>());
    QVERIFY(call("session_get_token")["result"].is_null());
}

void CommandServerTests::testSystemInfo()
{
    QCOMPARE(QString::fromStdString(call("get_platform")["result"].get<std::string>()),
             QStringLiteral("linux"));
    QCOMPARE(QString::fromStdString(call("get_app_version")["result"].get<std::string>()),
             QStringLiteral("1.4.2"));
    QCOMPARE(QString::fromStdString(call("get_theme")["result"].get<std::string>()),
             QStringLiteral("light"));
}

void CommandServerTests::testWindowCommands()
{
    QVERIFY(call("window_minimize").contains("result"));
    QVERIFY(call("window_maximize").contains("result"));
    QVERIFY(call("window_close").contains("result"));
    QVERIFY(call("open_external", {{"url", "https://unpod.example"}}).contains("result"));
    QVERIFY(call("open_external", {{"url", "mailto:"}}).contains("error"));

    QCOMPARE(m_commands->calls,
             (QStringList{QStringLiteral("minimize"), QStringLiteral("maximize"),
                          QStringLiteral("close"), QStringLiteral("open:https://unpod.example"),
                          QStringLiteral("open:mailto:")}));
}

void CommandServerTests::testNotificationCommands()
{
    QCOMPARE(QString::fromStdString(call("check_notification_permission")["result"].get<std::string>()),
             QStringLiteral("granted"));
    QVERIFY(call("request_notification_permission")["result"].get<bool>());
    QVERIFY(call("show_notification", {{"title", "Hi"}, {"body", "There"}}).contains("result"));

    m_commands->permission = unpod::NotificationPermission::Denied;
    const auto denied = call("show_notification", {{"title", "Hi"}, {"body", "There"}});
    QCOMPARE(QString::fromStdString(denied["error"].get<std::string>()),
             QStringLiteral("Notification permission not granted. State: denied"));
    QVERIFY(!call("request_notification_permission")["result"].get<bool>());

    QVERIFY(call("update_notification_badge", {{"count", 4}}).contains("result"));
    QCOMPARE(m_commands->badge.value_or(-1), 4);
    QVERIFY(call("update_notification_badge", {{"count", "four"}}).contains("error"));

    const auto negative = call("update_notification_badge", {{"count", -3}});
    QCOMPARE(QString::fromStdString(negative["error"].get<std::string>()),
             QStringLiteral("Invalid count"));
    const auto oversized = callRaw(QByteArrayLiteral(
        R"({"id": 8, "method": "update_notification_badge", "params": {"count": 4294967296}})"));
    QCOMPARE(QString::fromStdString(oversized["error"].get<std::string>()),
             QStringLiteral("Invalid count"));
    QCOMPARE(oversized["id"].get<int>(), 8);
    QVERIFY(call("update_notification_badge", {{"count", 2.5}}).contains("error"));
    QCOMPARE(m_commands->badge.value_or(-1), 4);

    const auto wideId = callRaw(QByteArrayLiteral(
        R"({"id": 4294967303, "method": "get_platform"})"));
    QCOMPARE(wideId["id"].get<qint64>(), Q_INT64_C(4294967303));
}

void CommandServerTests::testAsyncUpdateReply()
{
    std::optional<QByteArray> response;
    m_server->handleRequestPayload(
        QByteArrayLiteral(R"({"id": 3, "method": "updater_check_for_updates"})"),
        [&response](const QByteArray &reply) { response = reply; });

    QVERIFY(!response.has_value());
    QTRY_VERIFY(response.has_value());

    const auto parsed = nlohmann::json::parse(response->toStdString());
    QCOMPARE(parsed["id"].get<int>(), 3);
    QCOMPARE(QString::fromStdString(parsed["result"].get<std::string>()),
             QStringLiteral("Update available: 2.0.0"));
}

void CommandServerTests::testUpdateErrorReply()
{
    const auto reply = call("updater_download_and_install");
    QCOMPARE(QString::fromStdString(reply["error"].get<std::string>()),
             QStringLiteral("Auto-updates disabled in development"));
}

void CommandServerTests::testEmitEvent()
{
    QVERIFY(call("emit_event", {{"name", "show"}}).contains("result"));
    QVERIFY(call("emit_event", {{"name", "bogus"}}).contains("error"));
    QCOMPARE(m_commands->events, (QStringList{QStringLiteral("show"), QStringLiteral("bogus")}));
}

void CommandServerTests::testMalformedRequests()
{
    QCOMPARE(QString::fromStdString(callRaw("not json")["error"].get<std::string>()),
             QStringLiteral("Invalid JSON payload"));
    QCOMPARE(QString::fromStdString(callRaw(R"({"id": 1})")["error"].get<std::string>()),
             QStringLiteral("Missing method"));
    QCOMPARE(QString::fromStdString(
                 callRaw(R"({"id": 1, "method": "session_get", "params": [1]})")["error"]
                     .get<std::string>()),
             QStringLiteral("Invalid params"));
    QCOMPARE(QString::fromStdString(call("no_such_method")["error"].get<std::string>()),
             QStringLiteral("Unknown method"));
    QCOMPARE(QString::fromStdString(call("session_get")["error"].get<std::string>()),
             QStringLiteral("Missing key"));
}

void CommandServerTests::testPersistenceErrorBecomesReply()
{
    const QString blocker = m_tempDir.filePath(QStringLiteral("blocker-file"));
    QFile file(blocker);
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.close();

    FakeShellCommands broken((blocker + QStringLiteral("/session.db")).toStdString());
    unpod::CommandServer server(broken);

    std::optional<QByteArray> response;
    server.handleRequestPayload(
        QByteArrayLiteral(R"({"id": 9, "method": "session_set", "params": {"key": "a", "value": "b"}})"),
        [&response](const QByteArray &reply) { response = reply; });

    QVERIFY(response.has_value());
    const auto parsed = nlohmann::json::parse(response->toStdString());
    QCOMPARE(parsed["id"].get<int>(), 9);
    QVERIFY(parsed.contains("error"));
    QVERIFY(!parsed.contains("result"));
}

void CommandServerTests::testSocketRoundTrip()
{
    const QString socketPath = m_tempDir.filePath(QStringLiteral("unpod-shell.sock"));
    QVERIFY(m_server->start(socketPath));

    QLocalSocket socket;
    socket.connectToServer(socketPath);
    QVERIFY(socket.waitForConnected(1000));

    socket.write(QByteArrayLiteral(R"({"id": 1, "method": "get_platform"})"));
    QVERIFY(socket.waitForBytesWritten(1000));

    QByteArray response;
    QTRY_VERIFY_WITH_TIMEOUT((response += socket.readAll()).contains('\n'), 2000);

    const auto parsed = nlohmann::json::parse(response.trimmed().toStdString());
    QCOMPARE(parsed["id"].get<int>(), 1);
    QCOMPARE(QString::fromStdString(parsed["result"].get<std::string>()), QStringLiteral("linux"));
}

QTEST_MAIN(CommandServerTests)
#include "test_command_server.moc"
