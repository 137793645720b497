#pragma once

#include "database/database_access_queue.hpp"
#include "core/outcome_record.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <sqlite3.h>

/**
 * @brief Result of a database operation
 */
struct DBOpResult
{
    bool success;
    std::string error_message;
    DBOpResult(bool s = true, const std::string &msg = "") : success(s), error_message(msg) {}
};

/**
 * @brief SQLite store for the fetch "history" and "conversions" collections
 *
 * Both collections are append-only. The sqlite3 handle is only ever touched
 * from the access queue's worker thread.
 */
class DatabaseManager
{
public:
    static DatabaseManager &getInstance(const std::string &db_path = "");
    static void resetForTesting();
    static void shutdown();
    static bool isTestMode();
    DatabaseManager(const DatabaseManager &) = delete;
    DatabaseManager &operator=(const DatabaseManager &) = delete;

    ~DatabaseManager();

    /**
     * @brief Whether the database was opened and its tables created
     */
    bool isOpen() const { return open_; }

    const std::string &path() const { return db_path_; }

    /**
     * @brief Append a fetch record and wait for the insert to finish
     */
    DBOpResult storeFetchRecord(const FetchRecord &record);

    /**
     * @brief Append a convert record and wait for the insert to finish
     */
    DBOpResult storeConvertRecord(const ConvertRecord &record);

    /**
     * @brief Queue a fetch record insert and return immediately
     * @return Operation id usable with the access queue's result lookup
     */
    size_t enqueueFetchRecord(const FetchRecord &record);

    /**
     * @brief Queue a convert record insert and return immediately
     */
    size_t enqueueConvertRecord(const ConvertRecord &record);

    /**
     * @brief Most recent fetch records first
     * @param limit Maximum number of records (values < 1 are treated as 1)
     */
    std::vector<FetchRecord> getFetchHistory(int limit);

    /**
     * @brief Most recent convert records first
     */
    std::vector<ConvertRecord> getConversions(int limit);

    /**
     * @brief Names of the collections (tables) in the store
     */
    std::vector<std::string> listCollections();

    void waitForWrites();

private:
    explicit DatabaseManager(const std::string &db_path);

    bool openDatabase();
    bool initialize();
    DBOpResult executeStatement(const std::string &sql);

    static WriteOperationResult insertFetchRecord(DatabaseManager &dbMan, const FetchRecord &record);
    static WriteOperationResult insertConvertRecord(DatabaseManager &dbMan, const ConvertRecord &record);

    static std::unique_ptr<DatabaseManager> instance_;
    static std::mutex instance_mutex_;

    sqlite3 *db_;
    std::string db_path_;
    bool open_;
    std::unique_ptr<DatabaseAccessQueue> access_queue_;
};
