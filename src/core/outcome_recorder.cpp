#include "core/outcome_recorder.hpp"
#include "database/database_manager.hpp"
#include "logging/logger.hpp"

DatabaseOutcomeRecorder::DatabaseOutcomeRecorder(DatabaseManager &db_manager)
    : db_manager_(db_manager)
{
}

void DatabaseOutcomeRecorder::recordFetch(const FetchRecord &record)
{
    if (!db_manager_.isOpen())
    {
        throw RecorderFailure("Database " + db_manager_.path() + " is not open");
    }
    size_t op = db_manager_.enqueueFetchRecord(record);
    Logger::trace("OutcomeRecorder: queued history insert " + std::to_string(op) + " for session " + record.session_id);
}

void DatabaseOutcomeRecorder::recordConvert(const ConvertRecord &record)
{
    if (!db_manager_.isOpen())
    {
        throw RecorderFailure("Database " + db_manager_.path() + " is not open");
    }
    size_t op = db_manager_.enqueueConvertRecord(record);
    Logger::trace("OutcomeRecorder: queued conversions insert " + std::to_string(op) + " for " + record.output);
}
