#pragma once

#include <memory>
#include <optional>
#include <string>

namespace unpod {

/**
 * SessionStore persists small session facts (auth token, front-end
 * preferences) as an open string-to-string map in one SQLite file.
 *
 * The database is opened lazily on first access and stays open for the life
 * of the store. Every mutation commits before returning; a failed write
 * throws PersistenceError instead of leaving stale durable state behind.
 */
class SessionStore {
public:
    static constexpr const char *kDefaultNamespace = "session";
    static constexpr const char *kAuthTokenKey = "authToken";

    explicit SessionStore(std::string dbPath,
                          std::string nameSpace = kDefaultNamespace);
    ~SessionStore();

    SessionStore(const SessionStore &) = delete;
    SessionStore &operator=(const SessionStore &) = delete;

    std::optional<std::string> get(const std::string &key) const;
    void set(const std::string &key, const std::string &value);
    void remove(const std::string &key);
    void clear();

    std::optional<std::string> authToken() const;
    void setAuthToken(const std::string &token);
    void deleteAuthToken();

    const std::string &path() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl;
};

} // namespace unpod
