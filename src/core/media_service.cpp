#include "core/media_service.hpp"
#include "logging/logger.hpp"
#include <filesystem>

namespace fs = std::filesystem;

MediaService::MediaService(SessionWorkspaceManager &workspaces,
                           const FetchInvocationBuilder &fetch_builder,
                           const ConvertInvocationBuilder &convert_builder,
                           ProcessRunner &runner,
                           const ArtifactLocator &locator,
                           OutcomeRecorder &recorder,
                           std::string probe_binary)
    : workspaces_(workspaces), fetch_builder_(fetch_builder), convert_builder_(convert_builder),
      runner_(runner), locator_(locator), recorder_(recorder), probe_binary_(std::move(probe_binary))
{
}

std::string MediaService::fetch(const FetchRequest &request)
{
    Session session = workspaces_.newSession();
    ActiveSessionGuard active(workspaces_, session.id);
    Logger::info("MediaService: fetching " + request.url + " into session " + session.id);

    std::vector<std::string> args = fetch_builder_.build(request, session);
    std::string output = runner_.run(args);

    fs::path artifact = locator_.locate(session);

    FetchRecord record;
    record.session_id = session.id;
    record.url = request.url;
    record.format = MediaFormats::getName(request.format);
    record.audio_only = request.audio_only;
    record.subtitles = request.subtitles;
    record.embed_subs = request.embed_subs;
    record.out_dir = session.workspace_dir.string();
    record.output_hint = artifact.string();
    record.stdout_text = output;
    recordFetch(record);

    Logger::info("MediaService: fetch of " + request.url + " finished: " + artifact.string());
    return artifact.string();
}

std::vector<BatchItemResult> MediaService::fetchBatch(const std::vector<std::string> &urls, const FetchRequest &common)
{
    std::vector<BatchItemResult> results;
    results.reserve(urls.size());

    for (const auto &url : urls)
    {
        FetchRequest request = common;
        request.url = url;

        BatchItemResult item;
        item.url = url;
        try
        {
            item.path = fetch(request);
        }
        catch (const std::exception &e)
        {
            item.error = errorKindOf(e);
            item.detail = e.what();
            Logger::error("MediaService: batch item " + url + " failed: " + item.detail);
        }
        results.push_back(std::move(item));
    }
    return results;
}

std::string MediaService::convert(const ConvertRequest &request)
{
    ConvertInvocation invocation = convert_builder_.build(request);
    Logger::info("MediaService: converting " + request.input_path + " to " + invocation.output_path);

    runner_.run(invocation.args);

    ConvertRecord record;
    record.input = request.input_path;
    record.output = invocation.output_path;
    record.output_format = MediaFormats::getName(request.output_format);
    record.start = request.start.value_or("");
    record.end = request.end.value_or("");
    record.extra_args = request.extra_args;
    recordConvert(record);

    return invocation.output_path;
}

std::string MediaService::probe(const std::string &path)
{
    std::error_code ec;
    if (path.empty() || !fs::exists(path, ec))
    {
        throw InputNotFound(path, "File not found");
    }
    Logger::debug("MediaService: probing " + path);
    return runner_.run({probe_binary_, "-hide_banner", "-i", path});
}

std::string MediaService::errorKindOf(const std::exception &e)
{
    if (dynamic_cast<const ExternalToolFailure *>(&e))
        return "ExternalToolFailure";
    if (dynamic_cast<const InputNotFound *>(&e))
        return "InputNotFound";
    if (dynamic_cast<const WorkspaceCreationFailure *>(&e))
        return "WorkspaceCreationFailure";
    if (dynamic_cast<const RequestValidationError *>(&e))
        return "RequestValidationError";
    if (dynamic_cast<const RecorderFailure *>(&e))
        return "RecorderFailure";
    return "InternalError";
}

void MediaService::recordFetch(const FetchRecord &record)
{
    try
    {
        recorder_.recordFetch(record);
    }
    catch (const std::exception &e)
    {
        Logger::warn("MediaService: failed to record fetch of " + record.url + ": " + e.what());
    }
}

void MediaService::recordConvert(const ConvertRecord &record)
{
    try
    {
        recorder_.recordConvert(record);
    }
    catch (const std::exception &e)
    {
        Logger::warn("MediaService: failed to record conversion of " + record.input + ": " + e.what());
    }
}
