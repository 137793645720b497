#pragma once

#include "core/outcome_recorder.hpp"
#include <mutex>
#include <vector>

/**
 * @brief OutcomeRecorder double that keeps records in memory or fails on demand
 */
class FakeOutcomeRecorder : public OutcomeRecorder
{
public:
    bool fail = false;

    void recordFetch(const FetchRecord &record) override
    {
        if (fail)
            throw RecorderFailure("store unavailable");
        std::lock_guard<std::mutex> lock(mutex_);
        fetches.push_back(record);
    }

    void recordConvert(const ConvertRecord &record) override
    {
        if (fail)
            throw RecorderFailure("store unavailable");
        std::lock_guard<std::mutex> lock(mutex_);
        converts.push_back(record);
    }

    std::vector<FetchRecord> fetches;
    std::vector<ConvertRecord> converts;

private:
    std::mutex mutex_;
};
