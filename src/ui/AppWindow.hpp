#pragma once

#include <QString>

#include <optional>

class QMenuBar;

namespace unpod {

// Window handle used by the tray, the reactivation logic and the command
// surface. Query methods let callers skip steps that are already satisfied.
class AppWindow {
public:
    virtual ~AppWindow() = default;

    virtual bool isWindowMinimized() const = 0;
    virtual bool isWindowVisible() const = 0;
    virtual bool isWindowActive() const = 0;
    virtual bool isWindowMaximized() const = 0;

    virtual void unminimizeWindow() = 0;
    virtual void showWindow() = 0;
    virtual void focusWindow() = 0;
    // Brings the whole application to the foreground (MacOS).
    virtual void promoteApplication() = 0;

    virtual void minimizeWindow() = 0;
    virtual void maximizeWindow() = 0;
    virtual void unmaximizeWindow() = 0;
    virtual void toggleFullScreen() = 0;
    virtual void closeWindow() = 0;

    virtual void setTitle(const QString &title) = 0;
    virtual QString title() const = 0;

    // nullopt or 0 clears the badge. Returns false when the OS has no badge.
    virtual bool setBadgeCount(std::optional<int> count) = 0;

    // Takes ownership of menuBar.
    virtual void installMenuBar(QMenuBar *menuBar) = 0;
};

} // namespace unpod
