#include "core/session_workspace.hpp"
#include "logging/logger.hpp"
#include <Poco/UUID.h>
#include <Poco/UUIDGenerator.h>
#include <algorithm>

namespace fs = std::filesystem;

namespace
{
    // Appending to a file does not touch its directory's mtime
    fs::file_time_type newestModification(const fs::path &dir, std::error_code &ec)
    {
        fs::file_time_type newest = fs::last_write_time(dir, ec);
        if (ec)
            return newest;

        std::error_code walk_ec;
        fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, walk_ec);
        for (; !walk_ec && it != fs::recursive_directory_iterator(); it.increment(walk_ec))
        {
            std::error_code entry_ec;
            auto modified = fs::last_write_time(it->path(), entry_ec);
            if (!entry_ec && modified > newest)
                newest = modified;
        }
        return newest;
    }
}

SessionWorkspaceManager::SessionWorkspaceManager(fs::path root)
    : root_(std::move(root))
{
    std::error_code ec;
    fs::create_directories(root_, ec);
    if (ec)
    {
        Logger::error("SessionWorkspaceManager: cannot create workspace root " + root_.string() + ": " + ec.message());
    }
    else
    {
        Logger::info("SessionWorkspaceManager: workspace root is " + root_.string());
    }
}

bool SessionWorkspaceManager::isValidSessionId(const std::string &id)
{
    Poco::UUID uuid;
    return id.size() == 36 && uuid.tryParse(id);
}

Session SessionWorkspaceManager::newSession()
{
    Session session;
    session.id = Poco::UUIDGenerator::defaultGenerator().createRandom().toString();
    session.workspace_dir = root_ / session.id;
    session.created_at = std::chrono::system_clock::now();

    std::error_code ec;
    fs::create_directories(session.workspace_dir, ec);
    if (ec)
    {
        Logger::error("SessionWorkspaceManager: failed to create " + session.workspace_dir.string() + ": " + ec.message());
        throw WorkspaceCreationFailure("Failed to create session directory " + session.workspace_dir.string() + ": " + ec.message());
    }

    {
        std::lock_guard<std::mutex> lock(active_mutex_);
        active_.insert(session.id);
    }

    Logger::debug("SessionWorkspaceManager: created session " + session.id);
    return session;
}

void SessionWorkspaceManager::releaseSession(const std::string &id)
{
    std::lock_guard<std::mutex> lock(active_mutex_);
    active_.erase(id);
}

bool SessionWorkspaceManager::isActive(const std::string &id) const
{
    std::lock_guard<std::mutex> lock(active_mutex_);
    return active_.count(id) > 0;
}

bool SessionWorkspaceManager::removeSession(const std::string &id)
{
    if (!isValidSessionId(id))
        throw std::invalid_argument("Malformed session id: " + id);

    fs::path dir = root_ / id;
    std::error_code ec;
    if (!fs::is_directory(dir, ec))
        return false;

    auto removed = fs::remove_all(dir, ec);
    if (ec)
    {
        Logger::error("SessionWorkspaceManager: failed to remove " + dir.string() + ": " + ec.message());
        throw std::runtime_error("Failed to remove session " + id + ": " + ec.message());
    }

    releaseSession(id);
    Logger::info("SessionWorkspaceManager: removed session " + id + " (" + std::to_string(removed) + " entries)");
    return true;
}

std::vector<SessionEntry> SessionWorkspaceManager::listSessions() const
{
    std::vector<SessionEntry> sessions;
    std::error_code ec;
    fs::directory_iterator it(root_, ec);
    if (ec)
    {
        Logger::warn("SessionWorkspaceManager: cannot list " + root_.string() + ": " + ec.message());
        return sessions;
    }

    for (; it != fs::directory_iterator(); it.increment(ec))
    {
        if (ec)
            break;
        const auto &entry = *it;
        std::string name = entry.path().filename().string();
        std::error_code entry_ec;
        if (!entry.is_directory(entry_ec) || !isValidSessionId(name))
            continue;

        auto modified = newestModification(entry.path(), entry_ec);
        if (entry_ec)
            continue;
        sessions.push_back({name, entry.path(), modified});
    }

    std::sort(sessions.begin(), sessions.end(), [](const SessionEntry &a, const SessionEntry &b)
              { return a.id < b.id; });
    return sessions;
}
