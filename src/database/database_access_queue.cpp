#include "database/database_access_queue.hpp"
#include "database/database_manager.hpp"
#include "logging/logger.hpp"

DatabaseAccessQueue::DatabaseAccessQueue(DatabaseManager &dbMan)
    : db_manager_(dbMan)
{
    access_thread_ = std::thread(&DatabaseAccessQueue::access_thread_worker, this);
}

DatabaseAccessQueue::~DatabaseAccessQueue()
{
    stop();
    if (access_thread_.joinable())
    {
        access_thread_.join();
    }
}

size_t DatabaseAccessQueue::enqueueWrite(WriteOperation operation)
{
    size_t operation_id = next_operation_id_.fetch_add(1);
    Logger::trace("Enqueueing database write operation " + std::to_string(operation_id));
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        pending_operations_.fetch_add(1);
        operation_queue_.push(QueuedWrite(std::move(operation), operation_id));
    }
    queue_cv_.notify_one();
    return operation_id;
}

std::future<std::any> DatabaseAccessQueue::enqueueRead(ReadOperation operation)
{
    Logger::trace("Enqueueing database read operation");
    std::promise<std::any> promise;
    std::future<std::any> future = promise.get_future();
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        pending_operations_.fetch_add(1);
        operation_queue_.push(QueuedRead(std::move(operation), std::move(promise)));
    }
    queue_cv_.notify_one();
    return future;
}

void DatabaseAccessQueue::wait_for_completion()
{
    std::unique_lock<std::mutex> lock(queue_mutex_);
    idle_cv_.wait(lock, [this]
                  { return pending_operations_.load() == 0 || should_stop_.load(); });
}

void DatabaseAccessQueue::stop()
{
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        should_stop_ = true;
    }
    queue_cv_.notify_all();
    idle_cv_.notify_all();
}

WriteOperationResult DatabaseAccessQueue::getOperationResult(size_t operation_id) const
{
    std::lock_guard<std::mutex> lock(results_mutex_);
    auto it = operation_results_.find(operation_id);
    if (it != operation_results_.end())
    {
        return it->second;
    }
    return WriteOperationResult::Failure("Operation not found");
}

void DatabaseAccessQueue::recordResult(size_t operation_id, const WriteOperationResult &result)
{
    std::lock_guard<std::mutex> lock(results_mutex_);
    operation_results_[operation_id] = result;
    while (operation_results_.size() > MAX_TRACKED_RESULTS)
    {
        operation_results_.erase(operation_results_.begin());
    }
}

void DatabaseAccessQueue::access_thread_worker()
{
    while (true)
    {
        std::variant<QueuedWrite, QueuedRead> operation;

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this]
                           { return !operation_queue_.empty() || should_stop_.load(); });

            // Drain what is already queued before honouring stop
            if (operation_queue_.empty())
            {
                break;
            }

            operation = std::move(operation_queue_.front());
            operation_queue_.pop();
        }

        if (auto *write = std::get_if<QueuedWrite>(&operation))
        {
            size_t operation_id = write->second;
            try
            {
                WriteOperationResult result = write->first(db_manager_);
                if (!result.success)
                {
                    Logger::error("Database write operation " + std::to_string(operation_id) + " failed: " + result.error_message);
                }
                recordResult(operation_id, result);
            }
            catch (const std::exception &e)
            {
                Logger::error("Database write operation " + std::to_string(operation_id) + " threw: " + std::string(e.what()));
                recordResult(operation_id, WriteOperationResult::Failure(e.what()));
            }
        }
        else if (auto *read = std::get_if<QueuedRead>(&operation))
        {
            try
            {
                read->second.set_value(read->first(db_manager_));
            }
            catch (const std::exception &e)
            {
                Logger::error("Database read operation failed: " + std::string(e.what()));
                read->second.set_exception(std::current_exception());
            }
        }

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            pending_operations_.fetch_sub(1);
        }
        idle_cv_.notify_all();
    }

    Logger::debug("Database access thread exiting");
}
