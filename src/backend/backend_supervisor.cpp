#include "backend/backend_supervisor.hpp"

#include <QDir>
#include <QThread>

#include "common/errors.hpp"
#include "common/logging.hpp"

#include <nlohmann/json.hpp>

namespace unpod {

void ProcessHandleCell::store(const ProcessHandle &handle)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_handle = handle;
}

std::optional<ProcessHandle> ProcessHandleCell::peek() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_handle;
}

std::optional<ProcessHandle> ProcessHandleCell::take()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::optional<ProcessHandle> handle;
    handle.swap(m_handle);
    return handle;
}

BackendSupervisor::BackendSupervisor(const ShellConfig &config, ProcessControl &control)
    : m_config(config)
    , m_control(control)
{
}

QString BackendSupervisor::serverDir() const
{
    return QDir(m_config.resourceDir).filePath(QStringLiteral("server"));
}

QString BackendSupervisor::serverScript() const
{
    return QDir(serverDir()).filePath(QStringLiteral("server.js"));
}

QString BackendSupervisor::runtimeBinary() const
{
    return runtimeBinaryPath(m_config.platform, m_config.resourceDir, m_config.executableDir);
}

ProcessHandle BackendSupervisor::start()
{
    if (m_config.isDevelopment()) {
        ULOG_INFO(QStringLiteral("BackendSupervisor"),
                  QStringLiteral("start"),
                  QStringLiteral("backend_external"),
                  QStringLiteral("development_mode"),
                  QStringLiteral("sentinel_handle"),
                  logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"port", m_config.backendPort}}));
        return ProcessHandle{0, RuntimeMode::Development};
    }

    const QString dir = serverDir();
    if (!m_control.exists(dir)) {
        throw StartupError(StartupError::Kind::MissingResource,
                           "Server directory not found: " + dir.toStdString());
    }

    const QString runtime = runtimeBinary();
    if (!m_control.exists(runtime)) {
        throw StartupError(StartupError::Kind::MissingRuntime,
                           "Bundled Node.js not found at: " + runtime.toStdString());
    }

    LaunchSpec spec;
    spec.program = runtime;
    spec.arguments = QStringList{serverScript()};
    spec.workingDirectory = dir;
    spec.environment.insert(QStringLiteral("NODE_ENV"), QStringLiteral("production"));
    spec.environment.insert(QStringLiteral("PORT"), QString::number(m_config.backendPort));

    ULOG_INFO(QStringLiteral("BackendSupervisor"),
              QStringLiteral("start"),
              QStringLiteral("backend_spawn"),
              QStringLiteral("app_start"),
              QStringLiteral("detached_process"),
              logging::defaultWho(),
              QString(),
              (nlohmann::json{{"runtime", runtime.toStdString()},
                              {"script", serverScript().toStdString()},
                              {"port", m_config.backendPort},
                              {"platform", platformName(m_config.platform).toStdString()}}));

    const std::optional<qint64> pid = m_control.spawnDetached(spec);
    if (!pid.has_value() || *pid == 0) {
        throw StartupError(StartupError::Kind::SpawnFailed,
                           "Failed to launch backend runtime: " + runtime.toStdString());
    }

    ULOG_INFO(QStringLiteral("BackendSupervisor"),
              QStringLiteral("start"),
              QStringLiteral("backend_started"),
              QStringLiteral("app_start"),
              QStringLiteral("detached_process"),
              logging::defaultWho(),
              QString(),
              (nlohmann::json{{"pid", *pid},
                              {"settleMs", m_config.settleInterval.count()}}));

    // Grace period only; the service may still not be accepting connections.
    if (m_config.settleInterval.count() > 0) {
        QThread::msleep(static_cast<unsigned long>(m_config.settleInterval.count()));
    }

    return ProcessHandle{*pid, RuntimeMode::Production};
}

void BackendSupervisor::stop(const ProcessHandle &handle)
{
    if (handle.isSentinel()) {
        return;
    }

    const bool killed = m_control.terminate(handle.pid);
    if (killed) {
        ULOG_INFO(QStringLiteral("BackendSupervisor"),
                  QStringLiteral("stop"),
                  QStringLiteral("backend_stopped"),
                  QStringLiteral("app_shutdown"),
                  QStringLiteral("force_kill"),
                  logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"pid", handle.pid}}));
    } else {
        ULOG_WARN(QStringLiteral("BackendSupervisor"),
                  QStringLiteral("stop"),
                  QStringLiteral("backend_stop_failed"),
                  QStringLiteral("app_shutdown"),
                  QStringLiteral("force_kill"),
                  logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"pid", handle.pid}}));
    }
}

} // namespace unpod
