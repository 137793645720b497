#include "test_base.hpp"
#include "core/session_workspace.hpp"
#include <fstream>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

class SessionWorkspaceTest : public TestBase
{
};

TEST_F(SessionWorkspaceTest, NewSessionCreatesUuidNamedDirectory)
{
    SessionWorkspaceManager manager(getDownloadRoot());
    Session session = manager.newSession();

    EXPECT_TRUE(SessionWorkspaceManager::isValidSessionId(session.id));
    EXPECT_EQ(session.workspace_dir.string(), (getDownloadRoot() / session.id).string());
    EXPECT_TRUE(fs::is_directory(session.workspace_dir));
}

TEST_F(SessionWorkspaceTest, NewSessionIsActiveUntilReleased)
{
    SessionWorkspaceManager manager(getDownloadRoot());
    Session session = manager.newSession();
    EXPECT_TRUE(manager.isActive(session.id));

    {
        ActiveSessionGuard guard(manager, session.id);
    }
    EXPECT_FALSE(manager.isActive(session.id));
    EXPECT_TRUE(fs::is_directory(session.workspace_dir));
}

TEST_F(SessionWorkspaceTest, ListReportsNewestModificationInside)
{
    SessionWorkspaceManager manager(getDownloadRoot());
    Session session = manager.newSession();
    auto old_time = fs::file_time_type::clock::now() - std::chrono::hours(10);
    std::ofstream(session.workspace_dir / "video.webm.part") << "data";
    fs::last_write_time(session.workspace_dir, old_time);

    auto sessions = manager.listSessions();
    ASSERT_EQ(sessions.size(), 1u);
    EXPECT_GT(sessions[0].last_modified, old_time + std::chrono::hours(9));
}

TEST_F(SessionWorkspaceTest, CreatesMissingRootWithParents)
{
    fs::path nested_root = getDownloadRoot() / "a" / "b";
    SessionWorkspaceManager manager(nested_root);
    Session session = manager.newSession();
    EXPECT_TRUE(fs::is_directory(nested_root / session.id));
}

TEST_F(SessionWorkspaceTest, ConcurrentSessionsAreDistinct)
{
    SessionWorkspaceManager manager(getDownloadRoot());
    std::mutex mutex;
    std::set<std::string> ids;
    std::set<fs::path> dirs;

    std::vector<std::thread> threads;
    for (int i = 0; i < 16; ++i)
    {
        threads.emplace_back([&]()
                             {
            Session session = manager.newSession();
            std::lock_guard<std::mutex> lock(mutex);
            ids.insert(session.id);
            dirs.insert(session.workspace_dir); });
    }
    for (auto &t : threads)
        t.join();

    EXPECT_EQ(ids.size(), 16u);
    EXPECT_EQ(dirs.size(), 16u);
}

TEST_F(SessionWorkspaceTest, UnwritableRootFailsWithWorkspaceCreationFailure)
{
    // A regular file where the root directory should be
    fs::path blocker = createDummyFile("not_a_directory");
    SessionWorkspaceManager manager(blocker);
    EXPECT_THROW(manager.newSession(), WorkspaceCreationFailure);
}

TEST_F(SessionWorkspaceTest, RemoveSessionDeletesContents)
{
    SessionWorkspaceManager manager(getDownloadRoot());
    Session session = manager.newSession();
    std::ofstream(session.workspace_dir / "clip.mp4") << "data";

    EXPECT_TRUE(manager.removeSession(session.id));
    EXPECT_FALSE(fs::exists(session.workspace_dir));
    EXPECT_FALSE(manager.removeSession(session.id));
}

TEST_F(SessionWorkspaceTest, RemoveSessionRejectsMalformedIds)
{
    SessionWorkspaceManager manager(getDownloadRoot());
    EXPECT_THROW(manager.removeSession("../etc"), std::invalid_argument);
    EXPECT_THROW(manager.removeSession(""), std::invalid_argument);
    EXPECT_THROW(manager.removeSession("not-a-uuid"), std::invalid_argument);
}

TEST_F(SessionWorkspaceTest, ListSessionsIgnoresForeignDirectories)
{
    SessionWorkspaceManager manager(getDownloadRoot());
    Session first = manager.newSession();
    Session second = manager.newSession();
    fs::create_directories(getDownloadRoot() / "keep-me");
    std::ofstream(getDownloadRoot() / "notes.txt") << "x";

    auto sessions = manager.listSessions();
    ASSERT_EQ(sessions.size(), 2u);
    std::set<std::string> ids = {sessions[0].id, sessions[1].id};
    EXPECT_TRUE(ids.count(first.id));
    EXPECT_TRUE(ids.count(second.id));
    EXPECT_LT(sessions[0].id, sessions[1].id);
}
