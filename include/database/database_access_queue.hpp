#pragma once

#include <any>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <variant>

class DatabaseManager;

struct WriteOperationResult
{
    bool success;
    std::string error_message;

    WriteOperationResult(bool s = true, const std::string &msg = "")
        : success(s), error_message(msg) {}

    static WriteOperationResult Failure(const std::string &msg = "")
    {
        return WriteOperationResult(false, msg);
    }
};

using WriteOperation = std::function<WriteOperationResult(DatabaseManager &)>;
using ReadOperation = std::function<std::any(DatabaseManager &)>;

/**
 * @brief Serialises all SQLite access onto one worker thread
 *
 * Writes are fire-and-forget (their results are kept for a bounded window
 * and can be looked up by id); reads hand back a future.
 */
class DatabaseAccessQueue
{
public:
    static constexpr size_t MAX_TRACKED_RESULTS = 1024;

    explicit DatabaseAccessQueue(DatabaseManager &dbMan);
    ~DatabaseAccessQueue();

    size_t enqueueWrite(WriteOperation operation);
    std::future<std::any> enqueueRead(ReadOperation operation);

    // Block until every queued operation has run
    void wait_for_completion();

    void stop();

    WriteOperationResult getOperationResult(size_t operation_id) const;

    size_t pendingOperations() const { return pending_operations_.load(); }

private:
    using QueuedWrite = std::pair<WriteOperation, size_t>;
    using QueuedRead = std::pair<ReadOperation, std::promise<std::any>>;

    void access_thread_worker();
    void recordResult(size_t operation_id, const WriteOperationResult &result);

    DatabaseManager &db_manager_;
    std::queue<std::variant<QueuedWrite, QueuedRead>> operation_queue_;
    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable idle_cv_;
    std::thread access_thread_;
    std::atomic<bool> should_stop_{false};

    mutable std::mutex results_mutex_;
    std::map<size_t, WriteOperationResult> operation_results_;
    std::atomic<size_t> next_operation_id_{0};
    std::atomic<size_t> pending_operations_{0};
};
