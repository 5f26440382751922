#pragma once

#include <QObject>
#include <QString>

#include "common/platform.hpp"

class QGuiApplication;

namespace unpod {

class AppWindow;
class MainWindow;
class ShellTray;

struct ActivationEvent {
    enum class Kind {
        FocusGained,
        NotificationClicked,
        ShowRequested,
        CloseRequested
    };

    Kind kind = Kind::FocusGained;
    // Free-form origin tag, e.g. "tray-message" or "window".
    QString source;
};

QString activationKindName(ActivationEvent::Kind kind);

/**
 * ReactivationCoordinator funnels every "bring the window back" source
 * through one activate() routine.
 *
 * Each step of activate() is skipped when the window already satisfies it,
 * so overlapping events from different sources collapse into one visible
 * activation without debouncing. CloseRequested is not an activation and is
 * re-emitted as closeRequested().
 */
class ReactivationCoordinator : public QObject
{
    Q_OBJECT
public:
    ReactivationCoordinator(AppWindow &window,
                            PlatformFamily platform,
                            QObject *parent = nullptr);
    ~ReactivationCoordinator() override;

    // GUI thread only.
    void handle(const ActivationEvent &event);
    // Any thread; the event is handled on the coordinator's thread.
    void post(const ActivationEvent &event);

    // Returns true when at least one step changed the window.
    bool activate();

    // Front-end events: "show", "notification-action", "notification",
    // "notification://click". Returns false for any other name.
    bool handleFrontEndEvent(const QString &name);

    void wireWindow(MainWindow &window);
    void wireTray(ShellTray &tray);
    void wireApplication(QGuiApplication &app);

signals:
    void closeRequested();

private:
    AppWindow &m_window;
    PlatformFamily m_platform;
};

} // namespace unpod
