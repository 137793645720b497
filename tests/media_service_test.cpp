#include "test_base.hpp"
#include "core/media_service.hpp"
#include "stubs/fake_outcome_recorder.hpp"
#include "stubs/fake_process_runner.hpp"
#include <spdlog/sinks/ringbuffer_sink.h>
#include <spdlog/spdlog.h>
#include <set>
#include <thread>

namespace fs = std::filesystem;

class MediaServiceTest : public TestBase
{
protected:
    void SetUp() override
    {
        TestBase::SetUp();
        workspaces_ = std::make_unique<SessionWorkspaceManager>(getDownloadRoot());
        service_ = std::make_unique<MediaService>(*workspaces_, fetch_builder_, convert_builder_,
                                                  runner_, locator_, recorder_);
    }

    FetchRequest fetchRequest(const std::string &url = "https://example.com/watch?v=abc")
    {
        FetchRequest request;
        request.url = url;
        return request;
    }

    FetchInvocationBuilder fetch_builder_;
    ConvertInvocationBuilder convert_builder_;
    FakeProcessRunner runner_;
    ArtifactLocator locator_;
    FakeOutcomeRecorder recorder_;
    std::unique_ptr<SessionWorkspaceManager> workspaces_;
    std::unique_ptr<MediaService> service_;
};

TEST_F(MediaServiceTest, FetchReturnsProducedArtifactAndRecordsIt)
{
    runner_.artifact_name = "Title-abc.mp4";
    runner_.output = "[download] 100%";

    std::string path = service_->fetch(fetchRequest());

    EXPECT_EQ(fs::path(path).filename().string(), "Title-abc.mp4");
    EXPECT_EQ(fs::path(path).parent_path().parent_path().string(), getDownloadRoot().string());
    EXPECT_TRUE(fs::exists(path));

    ASSERT_EQ(recorder_.fetches.size(), 1u);
    const FetchRecord &record = recorder_.fetches.front();
    EXPECT_EQ(record.url, "https://example.com/watch?v=abc");
    EXPECT_EQ(record.format, "mp4");
    EXPECT_EQ(record.output_hint, path);
    EXPECT_EQ(record.out_dir, fs::path(path).parent_path().string());
    EXPECT_EQ(record.stdout_text, "[download] 100%");
    EXPECT_TRUE(SessionWorkspaceManager::isValidSessionId(record.session_id));
}

TEST_F(MediaServiceTest, FetchReleasesSessionWhenDone)
{
    runner_.artifact_name = "done.mp4";
    std::string path = service_->fetch(fetchRequest());
    std::string id = fs::path(path).parent_path().filename().string();
    EXPECT_FALSE(workspaces_->isActive(id));

    runner_.fail = true;
    EXPECT_THROW(service_->fetch(fetchRequest()), ExternalToolFailure);
    for (const auto &entry : workspaces_->listSessions())
    {
        EXPECT_FALSE(workspaces_->isActive(entry.id)) << entry.id;
    }
    EXPECT_EQ(workspaces_->listSessions().size(), 2u);
}

TEST_F(MediaServiceTest, SessionIsActiveWhileToolRuns)
{
    struct ObservingRunner : public ProcessRunner
    {
        SessionWorkspaceManager *workspaces = nullptr;
        bool active_during_run = false;

        std::string run(const std::vector<std::string> &args) override
        {
            for (size_t i = 0; i + 1 < args.size(); ++i)
            {
                if (args[i] == "-o")
                {
                    std::string id = fs::path(args[i + 1]).parent_path().filename().string();
                    active_during_run = workspaces->isActive(id);
                }
            }
            return "";
        }
    };

    ObservingRunner runner;
    runner.workspaces = workspaces_.get();
    MediaService service(*workspaces_, fetch_builder_, convert_builder_, runner, locator_, recorder_);
    service.fetch(fetchRequest());

    EXPECT_TRUE(runner.active_during_run);
}

TEST_F(MediaServiceTest, MissingArtifactIsReportedOnce)
{
    Logger::setLevel("INFO");
    auto logger = spdlog::get("media_server");
    ASSERT_TRUE(logger);
    auto sink = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(128);
    logger->sinks().push_back(sink);

    service_->fetch(fetchRequest());

    logger->sinks().pop_back();
    size_t warnings = 0;
    for (const auto &message : sink->last_raw())
    {
        if (message.level == spdlog::level::warn)
            ++warnings;
    }
    EXPECT_EQ(warnings, 1u);
}

TEST_F(MediaServiceTest, FetchWithoutMediaFileReturnsWorkspace)
{
    std::string path = service_->fetch(fetchRequest());

    EXPECT_TRUE(fs::is_directory(path));
    EXPECT_EQ(fs::path(path).parent_path().string(), getDownloadRoot().string());
    ASSERT_EQ(recorder_.fetches.size(), 1u);
    EXPECT_EQ(recorder_.fetches.front().output_hint, path);
}

TEST_F(MediaServiceTest, ToolFailurePropagatesAndIsNotRecorded)
{
    runner_.fail = true;
    runner_.fail_exit_code = 1;

    EXPECT_THROW(service_->fetch(fetchRequest()), ExternalToolFailure);
    EXPECT_TRUE(recorder_.fetches.empty());
}

TEST_F(MediaServiceTest, RecorderFailureDoesNotAffectFetch)
{
    recorder_.fail = true;
    runner_.artifact_name = "clip.webm";

    std::string path;
    ASSERT_NO_THROW(path = service_->fetch(fetchRequest()));
    EXPECT_EQ(fs::path(path).filename().string(), "clip.webm");
}

TEST_F(MediaServiceTest, RecorderFailureDoesNotAffectConvert)
{
    recorder_.fail = true;
    ConvertRequest request;
    request.input_path = createDummyFile("in.mp4").string();
    request.output_format = MediaFormat::MP3;

    std::string output;
    ASSERT_NO_THROW(output = service_->convert(request));
    EXPECT_EQ(output, (getTestFilesDir() / "in_conv.mp3").string());
}

TEST_F(MediaServiceTest, ConcurrentFetchesUseDistinctWorkspaces)
{
    runner_.artifact_name = "clip.mp4";
    const int count = 8;
    std::vector<std::string> paths(count);
    std::vector<std::thread> threads;
    for (int i = 0; i < count; ++i)
    {
        threads.emplace_back([this, i, &paths]()
                             { paths[i] = service_->fetch(fetchRequest("https://example.com/same")); });
    }
    for (auto &t : threads)
        t.join();

    std::set<std::string> workspaces;
    for (const auto &p : paths)
        workspaces.insert(fs::path(p).parent_path().string());
    EXPECT_EQ(workspaces.size(), static_cast<size_t>(count));
    EXPECT_EQ(recorder_.fetches.size(), static_cast<size_t>(count));
}

TEST_F(MediaServiceTest, ConvertOfMissingInputStartsNoProcess)
{
    ConvertRequest request;
    request.input_path = (getTestFilesDir() / "nope.mp4").string();
    request.output_format = MediaFormat::MP3;

    EXPECT_THROW(service_->convert(request), InputNotFound);
    EXPECT_EQ(runner_.invocationCount(), 0u);
    EXPECT_TRUE(recorder_.converts.empty());
}

TEST_F(MediaServiceTest, ConvertRunsTranscoderAndRecords)
{
    ConvertRequest request;
    request.input_path = createDummyFile("talk.mkv").string();
    request.output_format = MediaFormat::WAV;
    request.start = "00:00:05";
    request.extra_args = {"-ac", "1"};

    std::string output = service_->convert(request);

    ASSERT_EQ(runner_.invocationCount(), 1u);
    EXPECT_EQ(runner_.invocations().front().back(), output);
    ASSERT_EQ(recorder_.converts.size(), 1u);
    const ConvertRecord &record = recorder_.converts.front();
    EXPECT_EQ(record.input, request.input_path);
    EXPECT_EQ(record.output, output);
    EXPECT_EQ(record.output_format, "wav");
    EXPECT_EQ(record.start, "00:00:05");
    EXPECT_EQ(record.end, "");
    EXPECT_EQ(record.extra_args, (std::vector<std::string>{"-ac", "1"}));
}

TEST_F(MediaServiceTest, ProbeRunsFfprobeOnExistingFile)
{
    auto input = createDummyFile("probe.mp4").string();
    runner_.output = "Duration: 00:00:10.00";

    EXPECT_EQ(service_->probe(input), "Duration: 00:00:10.00");
    std::vector<std::string> expected = {"ffprobe", "-hide_banner", "-i", input};
    EXPECT_EQ(runner_.invocations().front(), expected);
}

TEST_F(MediaServiceTest, ProbeOfMissingFileStartsNoProcess)
{
    EXPECT_THROW(service_->probe((getTestFilesDir() / "missing.mp4").string()), InputNotFound);
    EXPECT_EQ(runner_.invocationCount(), 0u);
}

TEST_F(MediaServiceTest, BatchReportsPerUrlOutcome)
{
    runner_.artifact_name = "clip.mp3";
    runner_.failing_args = {"https://bad.example/x"};
    FetchRequest common;
    common.format = MediaFormat::MP3;
    common.audio_only = true;

    auto results = service_->fetchBatch({"https://good.example/1", "https://bad.example/x", "https://good.example/2"}, common);

    ASSERT_EQ(results.size(), 3u);
    EXPECT_TRUE(results[0].succeeded());
    EXPECT_EQ(results[0].url, "https://good.example/1");
    EXPECT_FALSE(results[1].succeeded());
    EXPECT_EQ(results[1].error, "ExternalToolFailure");
    EXPECT_EQ(results[1].detail, "ERROR: Unsupported URL");
    EXPECT_TRUE(results[2].succeeded());
    EXPECT_EQ(fs::path(results[2].path).filename().string(), "clip.mp3");

    EXPECT_EQ(runner_.invocationCount(), 3u);
    EXPECT_EQ(recorder_.fetches.size(), 2u);
    for (const auto &args : runner_.invocations())
    {
        EXPECT_NE(std::find(args.begin(), args.end(), "-x"), args.end());
    }
}

TEST_F(MediaServiceTest, ErrorKinds)
{
    EXPECT_EQ(MediaService::errorKindOf(ExternalToolFailure(1, "x")), "ExternalToolFailure");
    EXPECT_EQ(MediaService::errorKindOf(InputNotFound("p")), "InputNotFound");
    EXPECT_EQ(MediaService::errorKindOf(WorkspaceCreationFailure("w")), "WorkspaceCreationFailure");
    EXPECT_EQ(MediaService::errorKindOf(RequestValidationError("r")), "RequestValidationError");
    EXPECT_EQ(MediaService::errorKindOf(std::runtime_error("other")), "InternalError");
}

class DatabaseOutcomeRecorderTest : public TestBase
{
};

TEST_F(DatabaseOutcomeRecorderTest, RecordsReachTheStore)
{
    auto &db = openTestDatabase();
    ASSERT_TRUE(db.isOpen());
    DatabaseOutcomeRecorder recorder(db);

    FetchRecord fetch;
    fetch.session_id = "3f2b1c4d-0000-4000-8000-000000000001";
    fetch.url = "https://example.com/a";
    fetch.format = "mp4";
    recorder.recordFetch(fetch);

    ConvertRecord convert;
    convert.input = "/in.mp4";
    convert.output = "/in_conv.mp3";
    recorder.recordConvert(convert);

    db.waitForWrites();
    auto history = db.getFetchHistory(10);
    ASSERT_EQ(history.size(), 1u);
    EXPECT_EQ(history.front().url, "https://example.com/a");
    EXPECT_EQ(db.getConversions(10).size(), 1u);
}

TEST_F(DatabaseOutcomeRecorderTest, UnavailableStoreThrowsRecorderFailure)
{
    auto &db = DatabaseManager::getInstance((getTestFilesDir() / "no_such_dir" / "x.db").string());
    ASSERT_FALSE(db.isOpen());
    DatabaseOutcomeRecorder recorder(db);

    EXPECT_THROW(recorder.recordFetch(FetchRecord()), RecorderFailure);
    EXPECT_THROW(recorder.recordConvert(ConvertRecord()), RecorderFailure);
}
