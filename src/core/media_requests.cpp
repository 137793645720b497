#include "core/media_requests.hpp"
#include <filesystem>

using json = nlohmann::json;

namespace
{
    const json *findField(const json &body, const std::string &field)
    {
        auto it = body.find(field);
        if (it == body.end() || it->is_null())
            return nullptr;
        return &(*it);
    }

    std::string requireString(const json &body, const std::string &field)
    {
        const json *value = findField(body, field);
        if (!value)
            throw RequestValidationError("Field '" + field + "' is required");
        if (!value->is_string())
            throw RequestValidationError("Field '" + field + "' must be a string");
        return value->get<std::string>();
    }

    std::optional<std::string> optionalString(const json &body, const std::string &field)
    {
        const json *value = findField(body, field);
        if (!value)
            return std::nullopt;
        if (!value->is_string())
            throw RequestValidationError("Field '" + field + "' must be a string");
        return value->get<std::string>();
    }

    bool optionalBool(const json &body, const std::string &field, bool def)
    {
        const json *value = findField(body, field);
        if (!value)
            return def;
        if (!value->is_boolean())
            throw RequestValidationError("Field '" + field + "' must be a boolean");
        return value->get<bool>();
    }

    std::vector<std::string> optionalStringList(const json &body, const std::string &field)
    {
        std::vector<std::string> result;
        const json *value = findField(body, field);
        if (!value)
            return result;
        if (!value->is_array())
            throw RequestValidationError("Field '" + field + "' must be a list of strings");
        for (const auto &item : *value)
        {
            if (!item.is_string())
                throw RequestValidationError("Field '" + field + "' must be a list of strings");
            result.push_back(item.get<std::string>());
        }
        return result;
    }

    MediaFormat parseFormat(const std::string &name, const std::string &field)
    {
        auto format = MediaFormats::fromString(name);
        if (!format)
            throw RequestValidationError("Field '" + field + "' must be one of mp3, mp4, wav, mkv, webm, m4a, opus (got '" + name + "')");
        return *format;
    }

    void validateFilenameTemplate(const std::string &tmpl)
    {
        if (tmpl.empty())
            throw RequestValidationError("Field 'filename_template' must not be empty");

        std::filesystem::path path(tmpl);
        if (path.is_absolute() || path.has_root_name() || path.has_root_directory())
            throw RequestValidationError("Field 'filename_template' must be a relative path");
        for (const auto &part : path)
        {
            if (part.string() == "..")
                throw RequestValidationError("Field 'filename_template' must stay inside the session directory");
        }
    }

    FetchRequest parseFetchOptions(const json &body)
    {
        FetchRequest request;

        if (auto format = optionalString(body, "format"))
            request.format = parseFormat(*format, "format");

        // An explicit null quality falls back to the default selector
        if (body.contains("quality"))
            request.quality = optionalString(body, "quality").value_or("");

        request.subtitles = optionalBool(body, "subtitles", false);
        request.embed_subs = optionalBool(body, "embed_subs", false);
        request.audio_only = optionalBool(body, "audio_only", false);

        request.subtitle_langs = optionalStringList(body, "subtitle_langs");
        if (request.subtitle_langs.empty())
            request.subtitle_langs = {"en"};

        request.filename_template = optionalString(body, "filename_template");
        if (request.filename_template)
            validateFilenameTemplate(*request.filename_template);

        request.extra_args = optionalStringList(body, "ffmpeg_args");
        return request;
    }
}

FetchRequest parseFetchRequest(const json &body)
{
    if (!body.is_object())
        throw RequestValidationError("Request body must be a JSON object");

    FetchRequest request = parseFetchOptions(body);
    request.url = requireString(body, "url");
    if (request.url.empty())
        throw RequestValidationError("Field 'url' must not be empty");
    return request;
}

ConvertRequest parseConvertRequest(const json &body)
{
    if (!body.is_object())
        throw RequestValidationError("Request body must be a JSON object");

    ConvertRequest request;
    request.input_path = requireString(body, "input_path");
    if (request.input_path.empty())
        throw RequestValidationError("Field 'input_path' must not be empty");
    request.output_format = parseFormat(requireString(body, "output_format"), "output_format");

    // Empty trim bounds mean "not set"
    request.start = optionalString(body, "start");
    if (request.start && request.start->empty())
        request.start.reset();
    request.end = optionalString(body, "end");
    if (request.end && request.end->empty())
        request.end.reset();

    request.extra_args = optionalStringList(body, "extra_args");
    return request;
}

BatchRequest parseBatchRequest(const json &body)
{
    if (!body.is_object())
        throw RequestValidationError("Request body must be a JSON object");

    BatchRequest request;
    const json *urls = findField(body, "urls");
    if (!urls)
        throw RequestValidationError("Field 'urls' is required");
    request.urls = optionalStringList(body, "urls");
    if (request.urls.empty())
        throw RequestValidationError("Field 'urls' must contain at least one URL");
    for (const auto &url : request.urls)
    {
        if (url.empty())
            throw RequestValidationError("Field 'urls' must not contain empty URLs");
    }

    if (const json *common = findField(body, "common"))
    {
        if (!common->is_object())
            throw RequestValidationError("Field 'common' must be an object");
        request.common = parseFetchOptions(*common);
    }
    return request;
}
