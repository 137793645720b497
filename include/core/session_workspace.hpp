#pragma once

#include <chrono>
#include <filesystem>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * @brief One fetch invocation's private working directory
 */
struct Session
{
    std::string id;
    std::filesystem::path workspace_dir;
    std::chrono::system_clock::time_point created_at;
};

/**
 * @brief Existing session directory found under the workspace root
 *
 * last_modified is the newest modification time of the directory or of
 * anything below it.
 */
struct SessionEntry
{
    std::string id;
    std::filesystem::path workspace_dir;
    std::filesystem::file_time_type last_modified;
};

class WorkspaceCreationFailure : public std::runtime_error
{
public:
    explicit WorkspaceCreationFailure(const std::string &message) : std::runtime_error(message) {}
};

/**
 * @brief Allocates uniquely named session directories under a root
 *
 * Directories are named by a random UUID and outlive the request that
 * created them, so fetched files stay retrievable afterwards.
 */
class SessionWorkspaceManager
{
public:
    explicit SessionWorkspaceManager(std::filesystem::path root);

    /**
     * @brief Create a new session directory
     *
     * The session is marked active until releaseSession() is called.
     * @throws WorkspaceCreationFailure on filesystem errors
     */
    Session newSession();

    void releaseSession(const std::string &id);
    bool isActive(const std::string &id) const;

    /**
     * @brief Delete a session directory and everything in it
     * @param id Session UUID
     * @return false if no such session exists
     * @throws std::invalid_argument if id is not a well-formed UUID
     */
    bool removeSession(const std::string &id);

    /**
     * @brief Enumerate UUID-named directories under the root
     */
    std::vector<SessionEntry> listSessions() const;

    const std::filesystem::path &root() const { return root_; }

    static bool isValidSessionId(const std::string &id);

private:
    std::filesystem::path root_;

    mutable std::mutex active_mutex_;
    std::set<std::string> active_;
};

/**
 * @brief Releases an active session when the owning operation exits
 */
class ActiveSessionGuard
{
public:
    ActiveSessionGuard(SessionWorkspaceManager &workspaces, std::string id)
        : workspaces_(workspaces), id_(std::move(id)) {}
    ~ActiveSessionGuard() { workspaces_.releaseSession(id_); }

    ActiveSessionGuard(const ActiveSessionGuard &) = delete;
    ActiveSessionGuard &operator=(const ActiveSessionGuard &) = delete;

private:
    SessionWorkspaceManager &workspaces_;
    std::string id_;
};
