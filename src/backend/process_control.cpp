#include "backend/process_control.hpp"

#include <QFileInfo>
#include <QProcess>
#include <QProcessEnvironment>

#ifndef Q_OS_WIN
#include <signal.h>
#include <sys/types.h>
#endif

#include "common/logging.hpp"
#include <nlohmann/json.hpp>

namespace unpod {

namespace {

class SystemProcessControl : public ProcessControl {
public:
    explicit SystemProcessControl(PlatformFamily platform)
        : m_platform(platform)
    {
    }

    bool exists(const QString &path) const override
    {
        return QFileInfo::exists(path);
    }

    std::optional<qint64> spawnDetached(const LaunchSpec &spec) override
    {
        QProcess process;
        process.setProgram(spec.program);
        process.setArguments(spec.arguments);
        process.setWorkingDirectory(spec.workingDirectory);

        QProcessEnvironment env = QProcessEnvironment::systemEnvironment();
        for (auto it = spec.environment.cbegin(); it != spec.environment.cend(); ++it) {
            env.insert(it.key(), it.value());
        }
        process.setProcessEnvironment(env);

        process.setStandardInputFile(QProcess::nullDevice());
        process.setStandardOutputFile(QProcess::nullDevice());
        process.setStandardErrorFile(QProcess::nullDevice());

        qint64 pid = 0;
        if (!process.startDetached(&pid)) {
            ULOG_WARN(QStringLiteral("ProcessControl"),
                      QStringLiteral("spawnDetached"),
                      QStringLiteral("spawn_rejected"),
                      QStringLiteral("backend_start"),
                      QStringLiteral("qprocess_detached"),
                      logging::defaultWho(),
                      QString(),
                      (nlohmann::json{{"program", spec.program.toStdString()},
                                      {"error", process.errorString().toStdString()}}));
            return std::nullopt;
        }
        return pid;
    }

    bool terminate(qint64 pid) override
    {
        const TerminateCommand command = terminateCommand(m_platform, pid);
        if (!command.program.isEmpty()) {
            return QProcess::execute(command.program, command.arguments) == 0;
        }
#ifndef Q_OS_WIN
        return ::kill(static_cast<pid_t>(pid), SIGKILL) == 0;
#else
        return false;
#endif
    }

private:
    PlatformFamily m_platform;
};

} // namespace

std::unique_ptr<ProcessControl> ProcessControl::create(PlatformFamily platform)
{
    return std::make_unique<SystemProcessControl>(platform);
}

} // namespace unpod
