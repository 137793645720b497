#include "core/fetch_invocation_builder.hpp"
#include "logging/logger.hpp"

FetchInvocationBuilder::FetchInvocationBuilder(FetchToolOptions options)
    : options_(std::move(options))
{
}

std::string FetchInvocationBuilder::formatSelectorFor(const std::string &quality)
{
    if (quality.empty() || quality == "best")
        return BEST_FORMAT_SELECTOR;
    if (quality == "worst")
        return WORST_FORMAT_SELECTOR;
    return quality;
}

std::string FetchInvocationBuilder::joinPostprocessorArgs(const std::vector<std::string> &args)
{
    std::string joined;
    for (const auto &arg : args)
    {
        if (!joined.empty())
            joined += ' ';

        bool needs_quoting = arg.empty() || arg.find_first_of(" \t\n'\"\\$`") != std::string::npos;
        if (!needs_quoting)
        {
            joined += arg;
            continue;
        }

        joined += '\'';
        for (char c : arg)
        {
            if (c == '\'')
                joined += "'\"'\"'";
            else
                joined += c;
        }
        joined += '\'';
    }
    return joined;
}

std::vector<std::string> FetchInvocationBuilder::build(const FetchRequest &request, const Session &session) const
{
    const std::string format = MediaFormats::getName(request.format);

    // Templates are always rooted in the session workspace
    std::filesystem::path output_template = session.workspace_dir;
    if (request.filename_template && !request.filename_template->empty())
        output_template /= std::filesystem::path(*request.filename_template).relative_path();
    else
        output_template /= DEFAULT_OUTPUT_TEMPLATE;

    std::vector<std::string> args = {
        options_.tool_binary,
        request.url,
        "-o", output_template.string(),
        "--merge-output-format", format};

    if (request.audio_only)
    {
        args.insert(args.end(), {"-x", "--audio-format", format});
    }
    else
    {
        args.insert(args.end(), {"-f", formatSelectorFor(request.quality)});
    }

    if (request.subtitles)
    {
        std::string langs;
        for (const auto &lang : request.subtitle_langs)
        {
            if (!langs.empty())
                langs += ',';
            langs += lang;
        }
        if (langs.empty())
            langs = "en";

        args.insert(args.end(), {"--write-subs", "--sub-langs", langs});
        if (request.embed_subs)
            args.push_back("--embed-subs");
    }

    if (!request.extra_args.empty())
    {
        args.insert(args.end(), {"--postprocessor-args", "ffmpeg:" + joinPostprocessorArgs(request.extra_args)});
    }

    if (!options_.ffmpeg_location.empty())
    {
        args.insert(args.end(), {"--ffmpeg-location", options_.ffmpeg_location});
    }

    if (options_.sponsorblock_enabled)
    {
        args.insert(args.end(), {"--sponsorblock-remove", options_.sponsorblock_categories});
    }

    Logger::debug("FetchInvocationBuilder: built " + std::to_string(args.size()) + " arguments for session " + session.id);
    return args;
}
