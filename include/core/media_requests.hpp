#pragma once

#include "core/media_format.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * @brief Request to fetch remote media into a fresh session workspace
 */
struct FetchRequest
{
    std::string url;
    MediaFormat format = MediaFormat::MP4;
    std::string quality = "best"; // empty behaves like "best"
    bool subtitles = false;
    std::vector<std::string> subtitle_langs{"en"};
    bool embed_subs = false;
    bool audio_only = false;
    std::optional<std::string> filename_template;
    std::vector<std::string> extra_args; // post-processor arguments
};

/**
 * @brief Request to transcode and optionally trim a local file
 */
struct ConvertRequest
{
    std::string input_path;
    MediaFormat output_format = MediaFormat::MP4;
    std::optional<std::string> start;
    std::optional<std::string> end;
    std::vector<std::string> extra_args;
};

/**
 * @brief Several URLs fetched with shared options
 */
struct BatchRequest
{
    std::vector<std::string> urls;
    FetchRequest common;
};

class RequestValidationError : public std::runtime_error
{
public:
    explicit RequestValidationError(const std::string &message) : std::runtime_error(message) {}
};

/**
 * @brief Parse and validate a fetch request body
 * @throws RequestValidationError on missing or malformed fields
 */
FetchRequest parseFetchRequest(const nlohmann::json &body);

/**
 * @brief Parse and validate a convert request body
 * @throws RequestValidationError on missing or malformed fields
 */
ConvertRequest parseConvertRequest(const nlohmann::json &body);

/**
 * @brief Parse and validate a batch request body
 *
 * The optional "common" object uses the fetch request fields; its url is ignored.
 * @throws RequestValidationError on missing or malformed fields
 */
BatchRequest parseBatchRequest(const nlohmann::json &body);
