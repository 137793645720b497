#pragma once

#include "core/outcome_record.hpp"
#include <stdexcept>
#include <string>

class DatabaseManager;

class RecorderFailure : public std::runtime_error
{
public:
    explicit RecorderFailure(const std::string &message) : std::runtime_error(message) {}
};

/**
 * @brief Sink for the outcome of successful fetch and convert operations
 *
 * Recording is best-effort. Callers catch every failure, log it and carry on.
 */
class OutcomeRecorder
{
public:
    virtual ~OutcomeRecorder() = default;

    /**
     * @throws RecorderFailure if the record cannot be accepted
     */
    virtual void recordFetch(const FetchRecord &record) = 0;

    /**
     * @throws RecorderFailure if the record cannot be accepted
     */
    virtual void recordConvert(const ConvertRecord &record) = 0;
};

/**
 * @brief Appends records to the SQLite store without waiting for the insert
 */
class DatabaseOutcomeRecorder : public OutcomeRecorder
{
public:
    explicit DatabaseOutcomeRecorder(DatabaseManager &db_manager);

    void recordFetch(const FetchRecord &record) override;
    void recordConvert(const ConvertRecord &record) override;

private:
    DatabaseManager &db_manager_;
};
