#pragma once

#include "core/media_requests.hpp"
#include "core/session_workspace.hpp"
#include <string>
#include <vector>

/**
 * @brief Deployment-level switches for the fetch tool
 *
 * Filled from configuration/environment once at startup and injected into
 * the builder, so the builder itself never reads the environment.
 */
struct FetchToolOptions
{
    std::string tool_binary = "yt-dlp";
    std::string ffmpeg_location; // empty: let the fetch tool find its own transcoder
    bool sponsorblock_enabled = false;
    std::string sponsorblock_categories = "sponsor,intro,outro";
};

/**
 * @brief Translates a FetchRequest into the fetch tool's argument list
 */
class FetchInvocationBuilder
{
public:
    static constexpr const char *DEFAULT_OUTPUT_TEMPLATE = "%(title)s-%(id)s.%(ext)s";
    static constexpr const char *BEST_FORMAT_SELECTOR = "bestvideo+bestaudio/best";
    static constexpr const char *WORST_FORMAT_SELECTOR = "worstvideo+worstaudio/worst";

    explicit FetchInvocationBuilder(FetchToolOptions options = FetchToolOptions());

    /**
     * @brief Build the argument list for one fetch
     *
     * The URL and every user-supplied value occupy their own argument slot;
     * the list is meant for direct exec, never for a shell.
     *
     * Order: base arguments, quality branch, subtitles, post-processor
     * arguments, then tool options. The post-processor step is an extension:
     * the request's ffmpeg_args become one "--postprocessor-args ffmpeg:..."
     * pair, whereas the service this replaces accepted the field and ignored it.
     * @param request Validated fetch request
     * @param session Session whose workspace receives the output
     * @return Program name followed by its arguments
     */
    std::vector<std::string> build(const FetchRequest &request, const Session &session) const;

    /**
     * @brief Resolve the quality preset or custom selector to a -f value
     */
    static std::string formatSelectorFor(const std::string &quality);

    /**
     * @brief Render extra arguments as one post-processor argument string
     *
     * Each argument is single-quoted when needed so the fetch tool's
     * shell-style splitter yields the original list back.
     */
    static std::string joinPostprocessorArgs(const std::vector<std::string> &args);

    const FetchToolOptions &options() const { return options_; }

private:
    FetchToolOptions options_;
};
