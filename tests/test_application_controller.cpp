#include <QtTest/QtTest>

#include <QSignalSpy>
#include <QTemporaryDir>

#include <memory>
#include <vector>

#include "backend/process_control.hpp"
#include "shell/application_controller.hpp"
#include "ui/MainWindow.hpp"

namespace {

class FakeProcessControl : public unpod::ProcessControl {
public:
    explicit FakeProcessControl(std::vector<qint64> *terminated)
        : m_terminated(terminated)
    {
    }

    bool exists(const QString &path) const override { return existing.contains(path); }

    std::optional<qint64> spawnDetached(const unpod::LaunchSpec &) override
    {
        return qint64(555);
    }

    bool terminate(qint64 pid) override
    {
        m_terminated->push_back(pid);
        return true;
    }

    QStringList existing;

private:
    std::vector<qint64> *m_terminated;
};

} // namespace

class ApplicationControllerTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void testDevelopmentStartup();
    void testProductionStartupErrorIsPresented();
    void testShutdownTerminatesOnce();
    void testMissingTrayIsFatal();
    void testCommandDelegation();

private:
    QTemporaryDir m_tempDir;

    unpod::ShellConfig makeConfig(unpod::RuntimeMode mode, const QString &name) const;
    // Starts the controller with a tray present and waits for ready().
    static bool startUntilReady(unpod::ApplicationController &controller);
};

void ApplicationControllerTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
}

unpod::ShellConfig ApplicationControllerTests::makeConfig(unpod::RuntimeMode mode,
                                                          const QString &name) const
{
    unpod::ShellConfig config;
    config.appName = QStringLiteral("Unpod");
    config.appVersion = QStringLiteral("1.0.0");
    config.mode = mode;
    config.platform = unpod::PlatformFamily::Linux;
    config.resourceDir = m_tempDir.filePath(name + QStringLiteral("/resources"));
    config.executableDir = m_tempDir.filePath(name + QStringLiteral("/bin"));
    config.dataDir = m_tempDir.filePath(name + QStringLiteral("/data"));
    config.socketName = m_tempDir.filePath(name + QStringLiteral(".sock"));
    config.settleInterval = std::chrono::milliseconds(0);
    return config;
}

bool ApplicationControllerTests::startUntilReady(unpod::ApplicationController &controller)
{
    controller.tray().setTrayAvailability([]() { return true; });
    QSignalSpy readySpy(&controller, &unpod::ApplicationController::ready);
    QSignalSpy fatalSpy(&controller, &unpod::ApplicationController::fatalError);
    controller.start();

    QElapsedTimer timer;
    timer.start();
    while (readySpy.isEmpty() && fatalSpy.isEmpty() && timer.elapsed() < 5000) {
        QTest::qWait(10);
    }
    return readySpy.count() == 1 && fatalSpy.isEmpty();
}

void ApplicationControllerTests::testDevelopmentStartup()
{
    const auto config = makeConfig(unpod::RuntimeMode::Development, QStringLiteral("dev"));
    std::vector<qint64> terminated;
    unpod::MainWindow window;
    unpod::ApplicationController controller(config, window,
                                            std::make_unique<FakeProcessControl>(&terminated));
    int presented = 0;
    controller.setErrorPresenter([&presented](const QString &, const QString &) { ++presented; });

    QVERIFY(startUntilReady(controller));
    QCOMPARE(presented, 0);
    QVERIFY(!controller.commandServer().serverName().isEmpty());
    QVERIFY(!controller.tray().trayMenu().actions().isEmpty());
    QCOMPARE(window.title(), QStringLiteral("Unpod"));

    const auto handle = controller.processHandle().peek();
    QVERIFY(handle.has_value());
    QVERIFY(handle->isSentinel());

    controller.shutdown();
    QVERIFY(terminated.empty());
}

void ApplicationControllerTests::testProductionStartupErrorIsPresented()
{
    const auto config = makeConfig(unpod::RuntimeMode::Production, QStringLiteral("missing"));
    std::vector<qint64> terminated;
    unpod::MainWindow window;
    unpod::ApplicationController controller(config, window,
                                            std::make_unique<FakeProcessControl>(&terminated));
    QString presentedTitle;
    QString presentedMessage;
    controller.setErrorPresenter([&](const QString &title, const QString &message) {
        presentedTitle = title;
        presentedMessage = message;
    });

    QVERIFY(startUntilReady(controller));
    QCOMPARE(presentedTitle, QStringLiteral("Server Start Error"));
    QVERIFY(presentedMessage.contains(QStringLiteral("Server directory not found")));
    QVERIFY(!controller.processHandle().peek().has_value());
}

void ApplicationControllerTests::testShutdownTerminatesOnce()
{
    const auto config = makeConfig(unpod::RuntimeMode::Production, QStringLiteral("prod"));
    std::vector<qint64> terminated;
    auto control = std::make_unique<FakeProcessControl>(&terminated);
    control->existing << QDir(config.resourceDir).filePath(QStringLiteral("server"))
                      << QDir(config.resourceDir).filePath(QStringLiteral("node"));
    unpod::MainWindow window;
    unpod::ApplicationController controller(config, window, std::move(control));
    controller.setErrorPresenter([](const QString &, const QString &) {});

    QVERIFY(startUntilReady(controller));
    QCOMPARE(controller.processHandle().peek().value_or(unpod::ProcessHandle{}).pid, qint64(555));

    // The close hook terminates on its own; the later quit path finds the
    // cell empty.
    emit controller.coordinator().closeRequested();
    QCOMPARE(terminated.size(), size_t(1));
    QCOMPARE(terminated.front(), qint64(555));
    QVERIFY(!controller.processHandle().peek().has_value());

    controller.shutdown();
    QCOMPARE(terminated.size(), size_t(1));
}

void ApplicationControllerTests::testMissingTrayIsFatal()
{
    const auto config = makeConfig(unpod::RuntimeMode::Development, QStringLiteral("notray"));
    std::vector<qint64> terminated;
    unpod::MainWindow window;
    unpod::ApplicationController controller(config, window,
                                            std::make_unique<FakeProcessControl>(&terminated));
    controller.tray().setTrayAvailability([]() { return false; });
    QSignalSpy readySpy(&controller, &unpod::ApplicationController::ready);
    QSignalSpy fatalSpy(&controller, &unpod::ApplicationController::fatalError);

    controller.start();
    QTRY_COMPARE_WITH_TIMEOUT(fatalSpy.count(), 1, 5000);
    QCOMPARE(fatalSpy.takeFirst().at(0).toString(), QStringLiteral("System tray not available"));
    QCOMPARE(readySpy.count(), 0);
}

void ApplicationControllerTests::testCommandDelegation()
{
    const auto config = makeConfig(unpod::RuntimeMode::Development, QStringLiteral("commands"));
    std::vector<qint64> terminated;
    unpod::MainWindow window;
    unpod::ApplicationController controller(config, window,
                                            std::make_unique<FakeProcessControl>(&terminated));

    QCOMPARE(controller.platform(), QStringLiteral("linux"));
    QCOMPARE(controller.appVersion(), QStringLiteral("1.0.0"));
    QCOMPARE(controller.theme(), QStringLiteral("light"));

    controller.updateBadge(3);
    QCOMPARE(window.title(), QStringLiteral("(3) Unpod"));
    QCOMPARE(controller.tray().badge(), 3);

    controller.session().set("k", "v");
    QCOMPARE(QString::fromStdString(controller.session().get("k").value_or("")), QStringLiteral("v"));
    QVERIFY(QFile::exists(QDir(config.dataDir).filePath(QStringLiteral("session.db"))));

    QVERIFY(!controller.openExternal(QStringLiteral("not a url")));
    QVERIFY(!controller.emitEvent(QStringLiteral("unknown-event")));

    controller.toggleMaximizeWindow();
    QVERIFY(window.isWindowMaximized());
    controller.toggleMaximizeWindow();
    QVERIFY(!window.isWindowMaximized());
}

QTEST_MAIN(ApplicationControllerTests)
#include "test_application_controller.moc"
