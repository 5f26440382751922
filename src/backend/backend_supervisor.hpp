#pragma once

#include <QString>

#include <mutex>
#include <optional>

#include "backend/process_control.hpp"
#include "common/shell_config.hpp"

namespace unpod {

// pid 0 is the sentinel for "no managed process" (development stub).
struct ProcessHandle {
    qint64 pid = 0;
    RuntimeMode mode = RuntimeMode::Development;

    bool isSentinel() const { return pid == 0; }
};

// Lock-guarded holder for the one backend handle. A tray quit and a close
// request can race on shutdown; take() hands the handle out at most once.
class ProcessHandleCell {
public:
    void store(const ProcessHandle &handle);
    std::optional<ProcessHandle> peek() const;
    std::optional<ProcessHandle> take();

private:
    mutable std::mutex m_mutex;
    std::optional<ProcessHandle> m_handle;
};

/**
 * BackendSupervisor launches the bundled backend service and force-kills it
 * on shutdown. It supervises exactly one process and has no restart policy.
 *
 * start() blocks for the settle interval and must run off the GUI thread.
 */
class BackendSupervisor {
public:
    BackendSupervisor(const ShellConfig &config, ProcessControl &control);

    // Throws StartupError in production when the bundle is incomplete or the
    // launch is rejected. Development returns the sentinel without touching
    // the filesystem.
    ProcessHandle start();

    // Never throws; termination failures are logged and dropped.
    void stop(const ProcessHandle &handle);

    QString serverDir() const;
    QString serverScript() const;
    QString runtimeBinary() const;

private:
    const ShellConfig &m_config;
    ProcessControl &m_control;
};

} // namespace unpod
