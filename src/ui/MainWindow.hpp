#pragma once

#include <QMainWindow>

#include "ui/AppWindow.hpp"

class QLabel;

namespace unpod {

// MainWindow hosts the front-end and reports close and activation requests
// instead of acting on them.
class MainWindow : public QMainWindow, public AppWindow
{
    Q_OBJECT
public:
    explicit MainWindow(QWidget *parent = nullptr);
    ~MainWindow() override;

    bool isWindowMinimized() const override;
    bool isWindowVisible() const override;
    bool isWindowActive() const override;
    bool isWindowMaximized() const override;

    void unminimizeWindow() override;
    void showWindow() override;
    void focusWindow() override;
    void promoteApplication() override;

    void minimizeWindow() override;
    void maximizeWindow() override;
    void unmaximizeWindow() override;
    void toggleFullScreen() override;
    void closeWindow() override;

    void setTitle(const QString &title) override;
    QString title() const override;

    bool setBadgeCount(std::optional<int> count) override;

    void installMenuBar(QMenuBar *menuBar) override;

    void setStatusText(const QString &text);

signals:
    void closeRequested();
    void focusGained();

protected:
    void closeEvent(QCloseEvent *event) override;
    bool event(QEvent *event) override;

private:
    QLabel *m_statusLabel = nullptr;
};

} // namespace unpod
