#include <QtTest/QtTest>

#include <QSignalSpy>

#include <thread>

#include "fake_app_window.hpp"
#include "shell/reactivation_coordinator.hpp"

using unpod::ActivationEvent;

class ReactivationTests : public QObject
{
    Q_OBJECT
private slots:
    void testActivateFromMinimized();
    void testActivateFromHidden();
    void testAlreadyActiveIsNoop();
    void testMacOSPromotesApplication();
    void testOverlappingSourcesActivateOnce_data();
    void testOverlappingSourcesActivateOnce();
    void testCloseRequestedIsForwarded();
    void testFrontEndEvents();
    void testPostFromWorkerThread();
};

void ReactivationTests::testActivateFromMinimized()
{
    FakeAppWindow window;
    window.minimized = true;
    window.active = false;
    unpod::ReactivationCoordinator coordinator(window, unpod::PlatformFamily::Linux);

    QVERIFY(coordinator.activate());
    QCOMPARE(window.calls, (QStringList{QStringLiteral("unminimize"), QStringLiteral("focus")}));
    QVERIFY(!window.minimized);
    QVERIFY(window.active);
}

void ReactivationTests::testActivateFromHidden()
{
    FakeAppWindow window;
    window.visible = false;
    window.active = false;
    unpod::ReactivationCoordinator coordinator(window, unpod::PlatformFamily::Windows);

    QVERIFY(coordinator.activate());
    QCOMPARE(window.calls, (QStringList{QStringLiteral("show"), QStringLiteral("focus")}));
}

void ReactivationTests::testAlreadyActiveIsNoop()
{
    FakeAppWindow window;
    unpod::ReactivationCoordinator coordinator(window, unpod::PlatformFamily::Linux);

    QVERIFY(!coordinator.activate());
    QVERIFY(window.calls.isEmpty());
}

void ReactivationTests::testMacOSPromotesApplication()
{
    FakeAppWindow window;
    window.active = false;
    unpod::ReactivationCoordinator coordinator(window, unpod::PlatformFamily::MacOS);

    coordinator.handle({ActivationEvent::Kind::ShowRequested, QStringLiteral("tray")});
    QCOMPARE(window.calls, (QStringList{QStringLiteral("focus"), QStringLiteral("promote")}));
}

void ReactivationTests::testOverlappingSourcesActivateOnce_data()
{
    QTest::addColumn<QList<int>>("kinds");

    const int focus = static_cast<int>(ActivationEvent::Kind::FocusGained);
    const int clicked = static_cast<int>(ActivationEvent::Kind::NotificationClicked);
    const int shown = static_cast<int>(ActivationEvent::Kind::ShowRequested);

    QTest::newRow("focus-then-click") << QList<int>{focus, clicked};
    QTest::newRow("click-then-focus") << QList<int>{clicked, focus};
    QTest::newRow("click-only") << QList<int>{clicked};
    QTest::newRow("all-sources") << QList<int>{shown, clicked, focus, clicked};
}

void ReactivationTests::testOverlappingSourcesActivateOnce()
{
    QFETCH(QList<int>, kinds);

    FakeAppWindow window;
    window.minimized = true;
    window.visible = false;
    window.active = false;
    unpod::ReactivationCoordinator coordinator(window, unpod::PlatformFamily::Linux);

    for (int kind : kinds) {
        coordinator.handle({static_cast<ActivationEvent::Kind>(kind), QStringLiteral("test")});
    }

    QCOMPARE(window.calls,
             (QStringList{QStringLiteral("unminimize"), QStringLiteral("show"),
                          QStringLiteral("focus")}));
    QVERIFY(!window.minimized);
    QVERIFY(window.visible);
    QVERIFY(window.active);
}

void ReactivationTests::testCloseRequestedIsForwarded()
{
    FakeAppWindow window;
    window.active = false;
    unpod::ReactivationCoordinator coordinator(window, unpod::PlatformFamily::Linux);
    QSignalSpy closeSpy(&coordinator, &unpod::ReactivationCoordinator::closeRequested);

    coordinator.handle({ActivationEvent::Kind::CloseRequested, QStringLiteral("window")});

    QCOMPARE(closeSpy.count(), 1);
    QVERIFY(window.calls.isEmpty());
}

void ReactivationTests::testFrontEndEvents()
{
    FakeAppWindow window;
    unpod::ReactivationCoordinator coordinator(window, unpod::PlatformFamily::Linux);

    for (const char *name : {"show", "notification-action", "notification", "notification://click"}) {
        window.active = false;
        window.calls.clear();
        QVERIFY2(coordinator.handleFrontEndEvent(QString::fromLatin1(name)), name);
        QCOMPARE(window.calls, QStringList{QStringLiteral("focus")});
    }

    window.active = false;
    window.calls.clear();
    QVERIFY(!coordinator.handleFrontEndEvent(QStringLiteral("resize")));
    QVERIFY(window.calls.isEmpty());
}

void ReactivationTests::testPostFromWorkerThread()
{
    FakeAppWindow window;
    window.visible = false;
    window.active = false;
    unpod::ReactivationCoordinator coordinator(window, unpod::PlatformFamily::Linux);

    std::thread worker([&coordinator]() {
        coordinator.post({ActivationEvent::Kind::NotificationClicked, QStringLiteral("worker")});
    });
    worker.join();

    // Queued onto the coordinator's thread; nothing ran inline.
    QVERIFY(window.calls.isEmpty());
    QTRY_COMPARE(window.calls,
                 (QStringList{QStringLiteral("show"), QStringLiteral("focus")}));
}

QTEST_MAIN(ReactivationTests)
#include "test_reactivation.moc"
