#include "ui/MainWindow.hpp"

#include <QCloseEvent>
#include <QGuiApplication>
#include <QLabel>
#include <QMenuBar>
#include <QWindow>
#include <QtGlobal>

namespace unpod {

MainWindow::MainWindow(QWidget *parent)
    : QMainWindow(parent)
{
    m_statusLabel = new QLabel(this);
    m_statusLabel->setAlignment(Qt::AlignCenter);
    setCentralWidget(m_statusLabel);
    resize(1200, 800);
}

MainWindow::~MainWindow() = default;

bool MainWindow::isWindowMinimized() const
{
    return isMinimized();
}

bool MainWindow::isWindowVisible() const
{
    return isVisible();
}

bool MainWindow::isWindowActive() const
{
    return isActiveWindow();
}

bool MainWindow::isWindowMaximized() const
{
    return isMaximized();
}

void MainWindow::unminimizeWindow()
{
    setWindowState(windowState() & ~Qt::WindowMinimized);
}

void MainWindow::showWindow()
{
    show();
}

void MainWindow::focusWindow()
{
    raise();
    activateWindow();
}

void MainWindow::promoteApplication()
{
    if (QWindow *handle = windowHandle()) {
        handle->requestActivate();
    }
}

void MainWindow::minimizeWindow()
{
    showMinimized();
}

void MainWindow::maximizeWindow()
{
    showMaximized();
}

void MainWindow::unmaximizeWindow()
{
    showNormal();
}

void MainWindow::toggleFullScreen()
{
    if (isFullScreen()) {
        showNormal();
    } else {
        showFullScreen();
    }
}

void MainWindow::closeWindow()
{
    close();
}

void MainWindow::setTitle(const QString &title)
{
    setWindowTitle(title);
}

QString MainWindow::title() const
{
    return windowTitle();
}

bool MainWindow::setBadgeCount(std::optional<int> count)
{
#if QT_VERSION >= QT_VERSION_CHECK(6, 6, 0)
    auto *app = qobject_cast<QGuiApplication *>(QCoreApplication::instance());
    if (!app) {
        return false;
    }
    app->setBadgeNumber(count.value_or(0));
    return true;
#else
    Q_UNUSED(count);
    return false;
#endif
}

void MainWindow::installMenuBar(QMenuBar *menuBar)
{
    setMenuBar(menuBar);
}

void MainWindow::setStatusText(const QString &text)
{
    m_statusLabel->setText(text);
}

void MainWindow::closeEvent(QCloseEvent *event)
{
    emit closeRequested();
    event->accept();
}

bool MainWindow::event(QEvent *event)
{
    if (event->type() == QEvent::WindowActivate) {
        emit focusGained();
    }
    return QMainWindow::event(event);
}

} // namespace unpod
