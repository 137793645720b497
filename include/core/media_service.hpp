#pragma once

#include "core/artifact_locator.hpp"
#include "core/convert_invocation_builder.hpp"
#include "core/fetch_invocation_builder.hpp"
#include "core/media_requests.hpp"
#include "core/outcome_recorder.hpp"
#include "core/process_runner.hpp"
#include "core/session_workspace.hpp"
#include <string>
#include <vector>

/**
 * @brief Result of one URL within a batch fetch
 *
 * Exactly one of path or error is set.
 */
struct BatchItemResult
{
    std::string url;
    std::string path;
    std::string error;  // error kind, empty on success
    std::string detail; // bounded diagnostic, empty on success

    bool succeeded() const { return error.empty(); }
};

/**
 * @brief Fetch, convert and probe operations over the external media tools
 *
 * Holds references only; every collaborator must outlive the service.
 * Operations keep no per-request state and may run concurrently.
 */
class MediaService
{
public:
    MediaService(SessionWorkspaceManager &workspaces,
                 const FetchInvocationBuilder &fetch_builder,
                 const ConvertInvocationBuilder &convert_builder,
                 ProcessRunner &runner,
                 const ArtifactLocator &locator,
                 OutcomeRecorder &recorder,
                 std::string probe_binary = "ffprobe");

    /**
     * @brief Download one URL into a new session workspace
     * @return Path of the produced media file, or the workspace directory
     *         when no media file could be identified
     * @throws WorkspaceCreationFailure, ExternalToolFailure
     */
    std::string fetch(const FetchRequest &request);

    /**
     * @brief Fetch several URLs in order with shared options
     *
     * A failing URL is reported in its own item and the batch continues.
     */
    std::vector<BatchItemResult> fetchBatch(const std::vector<std::string> &urls, const FetchRequest &common);

    /**
     * @brief Transcode (and optionally trim) a local file
     * @return Output path
     * @throws InputNotFound, ExternalToolFailure
     */
    std::string convert(const ConvertRequest &request);

    /**
     * @brief Raw ffprobe report for a local file
     * @throws InputNotFound, ExternalToolFailure
     */
    std::string probe(const std::string &path);

    /**
     * @brief Error kind reported to clients for a failed operation
     */
    static std::string errorKindOf(const std::exception &e);

private:
    void recordFetch(const FetchRecord &record);
    void recordConvert(const ConvertRecord &record);

    SessionWorkspaceManager &workspaces_;
    const FetchInvocationBuilder &fetch_builder_;
    const ConvertInvocationBuilder &convert_builder_;
    ProcessRunner &runner_;
    const ArtifactLocator &locator_;
    OutcomeRecorder &recorder_;
    std::string probe_binary_;
};
