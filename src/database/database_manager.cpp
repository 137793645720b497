#include "database/database_manager.hpp"
#include "logging/logger.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cstdlib>

using json = nlohmann::json;

std::unique_ptr<DatabaseManager> DatabaseManager::instance_ = nullptr;
std::mutex DatabaseManager::instance_mutex_;

namespace
{
    std::string columnText(sqlite3_stmt *stmt, int column)
    {
        const unsigned char *text = sqlite3_column_text(stmt, column);
        return text ? reinterpret_cast<const char *>(text) : "";
    }

    // Statement handle that is always finalized
    class Statement
    {
    public:
        Statement(sqlite3 *db, const std::string &sql) : stmt_(nullptr)
        {
            rc_ = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt_, nullptr);
        }
        ~Statement()
        {
            if (stmt_)
                sqlite3_finalize(stmt_);
        }
        Statement(const Statement &) = delete;
        Statement &operator=(const Statement &) = delete;

        bool ok() const { return rc_ == SQLITE_OK; }
        sqlite3_stmt *get() { return stmt_; }

        void bindText(int index, const std::string &value)
        {
            sqlite3_bind_text(stmt_, index, value.c_str(), -1, SQLITE_TRANSIENT);
        }

    private:
        sqlite3_stmt *stmt_;
        int rc_;
    };
}

DatabaseManager &DatabaseManager::getInstance(const std::string &db_path)
{
    std::lock_guard<std::mutex> lock(instance_mutex_);
    if (!instance_)
    {
        if (db_path.empty())
        {
            throw std::runtime_error("DatabaseManager::getInstance called with empty db_path for first initialization");
        }
        instance_ = std::unique_ptr<DatabaseManager>(new DatabaseManager(db_path));
    }
    else if (isTestMode() && !db_path.empty() && instance_->db_path_ != db_path)
    {
        Logger::info("Test mode: Reinitializing DatabaseManager with new test database: " + db_path);
        instance_->waitForWrites();
        instance_.reset();
        instance_ = std::unique_ptr<DatabaseManager>(new DatabaseManager(db_path));
    }
    else if (!db_path.empty() && instance_->db_path_ != db_path)
    {
        Logger::warn("DatabaseManager singleton already initialized with different path: " +
                     instance_->db_path_ + " vs " + db_path);
    }
    return *instance_;
}

void DatabaseManager::resetForTesting()
{
    shutdown();
}

void DatabaseManager::shutdown()
{
    std::lock_guard<std::mutex> lock(instance_mutex_);
    if (instance_)
    {
        instance_->waitForWrites();
        instance_.reset();
    }
}

bool DatabaseManager::isTestMode()
{
    const char *test_mode = std::getenv("TEST_MODE");
    return test_mode != nullptr && std::string(test_mode) == "1";
}

DatabaseManager::DatabaseManager(const std::string &db_path)
    : db_(nullptr), db_path_(db_path), open_(false)
{
    Logger::info("DatabaseManager: opening " + db_path);
    access_queue_ = std::make_unique<DatabaseAccessQueue>(*this);

    if (!openDatabase())
    {
        Logger::error("DatabaseManager: database unavailable, outcome records will be dropped");
        return;
    }
    open_ = initialize();
    if (open_)
        Logger::info("DatabaseManager: initialization completed");
}

DatabaseManager::~DatabaseManager()
{
    if (access_queue_)
    {
        auto close_future = access_queue_->enqueueRead([](DatabaseManager &dbMan)
                                                       {
            if (dbMan.db_)
            {
                sqlite3_close(dbMan.db_);
                dbMan.db_ = nullptr;
                Logger::info("DatabaseManager: connection closed");
            }
            return std::any(true); });
        try
        {
            close_future.get();
        }
        catch (const std::exception &e)
        {
            Logger::error("DatabaseManager: error while closing: " + std::string(e.what()));
        }
        access_queue_->stop();
    }
}

bool DatabaseManager::openDatabase()
{
    std::string path = db_path_;
    auto open_future = access_queue_->enqueueRead([path](DatabaseManager &dbMan)
                                                  {
        int rc = sqlite3_open(path.c_str(), &dbMan.db_);
        if (rc != SQLITE_OK)
        {
            Logger::error("Failed to open database: " + std::string(sqlite3_errmsg(dbMan.db_)));
            sqlite3_close(dbMan.db_);
            dbMan.db_ = nullptr;
            return std::any(false);
        }

        rc = sqlite3_exec(dbMan.db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
        if (rc != SQLITE_OK)
        {
            Logger::warn("Failed to enable WAL mode: " + std::string(sqlite3_errmsg(dbMan.db_)));
        }
        sqlite3_exec(dbMan.db_, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, nullptr);
        sqlite3_busy_timeout(dbMan.db_, 5000);
        return std::any(true); });

    try
    {
        return std::any_cast<bool>(open_future.get());
    }
    catch (const std::exception &e)
    {
        Logger::error("DatabaseManager: open failed: " + std::string(e.what()));
        return false;
    }
}

bool DatabaseManager::initialize()
{
    const std::string history_sql = R"(
        CREATE TABLE IF NOT EXISTS history (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            session_id TEXT NOT NULL,
            url TEXT NOT NULL,
            format TEXT NOT NULL,
            audio_only BOOLEAN NOT NULL DEFAULT 0,
            subtitles BOOLEAN NOT NULL DEFAULT 0,
            embed_subs BOOLEAN NOT NULL DEFAULT 0,
            out_dir TEXT,
            output_hint TEXT,
            stdout TEXT,
            created_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP
        )
    )";
    const std::string conversions_sql = R"(
        CREATE TABLE IF NOT EXISTS conversions (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            input TEXT NOT NULL,
            output TEXT NOT NULL,
            output_format TEXT,
            start_time TEXT,
            end_time TEXT,
            extra_args TEXT,       -- JSON array
            created_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP
        )
    )";

    auto history = executeStatement(history_sql);
    if (!history.success)
    {
        Logger::error("Failed to create history table: " + history.error_message);
        return false;
    }
    auto conversions = executeStatement(conversions_sql);
    if (!conversions.success)
    {
        Logger::error("Failed to create conversions table: " + conversions.error_message);
        return false;
    }
    return true;
}

void DatabaseManager::waitForWrites()
{
    if (access_queue_)
    {
        access_queue_->wait_for_completion();
    }
}

DBOpResult DatabaseManager::executeStatement(const std::string &sql)
{
    size_t op = access_queue_->enqueueWrite([sql](DatabaseManager &dbMan)
                                            {
        if (!dbMan.db_)
        {
            return WriteOperationResult::Failure("Database not initialized");
        }
        char *err_msg = nullptr;
        int rc = sqlite3_exec(dbMan.db_, sql.c_str(), nullptr, nullptr, &err_msg);
        if (rc != SQLITE_OK)
        {
            std::string error_msg = "SQL execution failed: " + std::string(err_msg ? err_msg : "unknown error");
            sqlite3_free(err_msg);
            return WriteOperationResult::Failure(error_msg);
        }
        return WriteOperationResult(true); });
    waitForWrites();

    auto result = access_queue_->getOperationResult(op);
    return DBOpResult(result.success, result.error_message);
}

WriteOperationResult DatabaseManager::insertFetchRecord(DatabaseManager &dbMan, const FetchRecord &record)
{
    if (!dbMan.db_)
    {
        return WriteOperationResult::Failure("Database not initialized");
    }

    const std::string insert_sql = R"(
        INSERT INTO history (session_id, url, format, audio_only, subtitles, embed_subs, out_dir, output_hint, stdout)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)
    )";
    Statement stmt(dbMan.db_, insert_sql);
    if (!stmt.ok())
    {
        return WriteOperationResult::Failure("Failed to prepare history insert: " + std::string(sqlite3_errmsg(dbMan.db_)));
    }

    stmt.bindText(1, record.session_id);
    stmt.bindText(2, record.url);
    stmt.bindText(3, record.format);
    sqlite3_bind_int(stmt.get(), 4, record.audio_only ? 1 : 0);
    sqlite3_bind_int(stmt.get(), 5, record.subtitles ? 1 : 0);
    sqlite3_bind_int(stmt.get(), 6, record.embed_subs ? 1 : 0);
    stmt.bindText(7, record.out_dir);
    stmt.bindText(8, record.output_hint);
    stmt.bindText(9, record.stdout_text);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE)
    {
        return WriteOperationResult::Failure("Failed to insert history record: " + std::string(sqlite3_errmsg(dbMan.db_)));
    }
    return WriteOperationResult(true);
}

WriteOperationResult DatabaseManager::insertConvertRecord(DatabaseManager &dbMan, const ConvertRecord &record)
{
    if (!dbMan.db_)
    {
        return WriteOperationResult::Failure("Database not initialized");
    }

    const std::string insert_sql = R"(
        INSERT INTO conversions (input, output, output_format, start_time, end_time, extra_args)
        VALUES (?, ?, ?, ?, ?, ?)
    )";
    Statement stmt(dbMan.db_, insert_sql);
    if (!stmt.ok())
    {
        return WriteOperationResult::Failure("Failed to prepare conversions insert: " + std::string(sqlite3_errmsg(dbMan.db_)));
    }

    stmt.bindText(1, record.input);
    stmt.bindText(2, record.output);
    stmt.bindText(3, record.output_format);
    stmt.bindText(4, record.start);
    stmt.bindText(5, record.end);
    stmt.bindText(6, json(record.extra_args).dump());

    if (sqlite3_step(stmt.get()) != SQLITE_DONE)
    {
        return WriteOperationResult::Failure("Failed to insert conversion record: " + std::string(sqlite3_errmsg(dbMan.db_)));
    }
    return WriteOperationResult(true);
}

size_t DatabaseManager::enqueueFetchRecord(const FetchRecord &record)
{
    return access_queue_->enqueueWrite([record](DatabaseManager &dbMan)
                                       { return insertFetchRecord(dbMan, record); });
}

size_t DatabaseManager::enqueueConvertRecord(const ConvertRecord &record)
{
    return access_queue_->enqueueWrite([record](DatabaseManager &dbMan)
                                       { return insertConvertRecord(dbMan, record); });
}

DBOpResult DatabaseManager::storeFetchRecord(const FetchRecord &record)
{
    size_t op = enqueueFetchRecord(record);
    waitForWrites();
    auto result = access_queue_->getOperationResult(op);
    return DBOpResult(result.success, result.error_message);
}

DBOpResult DatabaseManager::storeConvertRecord(const ConvertRecord &record)
{
    size_t op = enqueueConvertRecord(record);
    waitForWrites();
    auto result = access_queue_->getOperationResult(op);
    return DBOpResult(result.success, result.error_message);
}

std::vector<FetchRecord> DatabaseManager::getFetchHistory(int limit)
{
    limit = std::max(limit, 1);
    auto future = access_queue_->enqueueRead([limit](DatabaseManager &dbMan)
                                             {
        std::vector<FetchRecord> records;
        if (!dbMan.db_)
        {
            throw std::runtime_error("Database not initialized");
        }

        Statement stmt(dbMan.db_, R"(
            SELECT id, session_id, url, format, audio_only, subtitles, embed_subs,
                   out_dir, output_hint, stdout, created_at
            FROM history ORDER BY id DESC LIMIT ?
        )");
        if (!stmt.ok())
        {
            throw std::runtime_error("Failed to prepare history query: " + std::string(sqlite3_errmsg(dbMan.db_)));
        }
        sqlite3_bind_int(stmt.get(), 1, limit);

        while (sqlite3_step(stmt.get()) == SQLITE_ROW)
        {
            FetchRecord record;
            record.id = sqlite3_column_int64(stmt.get(), 0);
            record.session_id = columnText(stmt.get(), 1);
            record.url = columnText(stmt.get(), 2);
            record.format = columnText(stmt.get(), 3);
            record.audio_only = sqlite3_column_int(stmt.get(), 4) != 0;
            record.subtitles = sqlite3_column_int(stmt.get(), 5) != 0;
            record.embed_subs = sqlite3_column_int(stmt.get(), 6) != 0;
            record.out_dir = columnText(stmt.get(), 7);
            record.output_hint = columnText(stmt.get(), 8);
            record.stdout_text = columnText(stmt.get(), 9);
            record.created_at = columnText(stmt.get(), 10);
            records.push_back(std::move(record));
        }
        return std::any(records); });

    return std::any_cast<std::vector<FetchRecord>>(future.get());
}

std::vector<ConvertRecord> DatabaseManager::getConversions(int limit)
{
    limit = std::max(limit, 1);
    auto future = access_queue_->enqueueRead([limit](DatabaseManager &dbMan)
                                             {
        std::vector<ConvertRecord> records;
        if (!dbMan.db_)
        {
            throw std::runtime_error("Database not initialized");
        }

        Statement stmt(dbMan.db_, R"(
            SELECT id, input, output, output_format, start_time, end_time, extra_args, created_at
            FROM conversions ORDER BY id DESC LIMIT ?
        )");
        if (!stmt.ok())
        {
            throw std::runtime_error("Failed to prepare conversions query: " + std::string(sqlite3_errmsg(dbMan.db_)));
        }
        sqlite3_bind_int(stmt.get(), 1, limit);

        while (sqlite3_step(stmt.get()) == SQLITE_ROW)
        {
            ConvertRecord record;
            record.id = sqlite3_column_int64(stmt.get(), 0);
            record.input = columnText(stmt.get(), 1);
            record.output = columnText(stmt.get(), 2);
            record.output_format = columnText(stmt.get(), 3);
            record.start = columnText(stmt.get(), 4);
            record.end = columnText(stmt.get(), 5);
            std::string extra = columnText(stmt.get(), 6);
            if (!extra.empty())
            {
                auto parsed = json::parse(extra, nullptr, false);
                if (parsed.is_array())
                    record.extra_args = parsed.get<std::vector<std::string>>();
            }
            record.created_at = columnText(stmt.get(), 7);
            records.push_back(std::move(record));
        }
        return std::any(records); });

    return std::any_cast<std::vector<ConvertRecord>>(future.get());
}

std::vector<std::string> DatabaseManager::listCollections()
{
    auto future = access_queue_->enqueueRead([](DatabaseManager &dbMan)
                                             {
        std::vector<std::string> names;
        if (!dbMan.db_)
        {
            throw std::runtime_error("Database not initialized");
        }

        Statement stmt(dbMan.db_, "SELECT name FROM sqlite_master WHERE type = 'table' AND name NOT LIKE 'sqlite_%' ORDER BY name");
        if (!stmt.ok())
        {
            throw std::runtime_error("Failed to list tables: " + std::string(sqlite3_errmsg(dbMan.db_)));
        }
        while (sqlite3_step(stmt.get()) == SQLITE_ROW)
        {
            names.push_back(columnText(stmt.get(), 0));
        }
        return std::any(names); });

    return std::any_cast<std::vector<std::string>>(future.get());
}
