#pragma once

#include <cstdint>
#include <string>
#include <vector>

/**
 * @brief One entry of the "history" collection (a completed fetch)
 */
struct FetchRecord
{
    int64_t id;
    std::string session_id;
    std::string url;
    std::string format;
    bool audio_only;
    bool subtitles;
    bool embed_subs;
    std::string out_dir;
    std::string output_hint;
    std::string stdout_text;
    std::string created_at;

    FetchRecord() : id(0), audio_only(false), subtitles(false), embed_subs(false) {}
};

/**
 * @brief One entry of the "conversions" collection (a completed convert)
 */
struct ConvertRecord
{
    int64_t id;
    std::string input;
    std::string output;
    std::string output_format;
    std::string start;
    std::string end;
    std::vector<std::string> extra_args;
    std::string created_at;

    ConvertRecord() : id(0) {}
};
