#pragma once

#include <stdexcept>
#include <string>

namespace unpod {

// Backend could not be brought up. Fatal to the feature, not to the shell.
class StartupError : public std::runtime_error {
public:
    enum class Kind {
        MissingResource,
        MissingRuntime,
        SpawnFailed
    };

    StartupError(Kind kind, const std::string &message)
        : std::runtime_error(message)
        , m_kind(kind)
    {
    }

    Kind kind() const { return m_kind; }

private:
    Kind m_kind;
};

// The session blob could not be opened or a mutation was not persisted.
class PersistenceError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Menu or tray construction was rejected by the widget toolkit. Aborts launch.
class ToolkitError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

inline const char *startupErrorKindName(StartupError::Kind kind)
{
    switch (kind) {
    case StartupError::Kind::MissingResource:
        return "missing_resource";
    case StartupError::Kind::MissingRuntime:
        return "missing_runtime";
    case StartupError::Kind::SpawnFailed:
        return "spawn_failed";
    }
    return "spawn_failed";
}

} // namespace unpod
