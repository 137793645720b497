#include <gtest/gtest.h>
#include "core/fetch_invocation_builder.hpp"
#include <algorithm>
#include <chrono>

namespace
{
    Session makeSession()
    {
        return Session{"3f2b1c4d-0000-4000-8000-000000000001", "/tmp/downloads/3f2b1c4d-0000-4000-8000-000000000001",
                       std::chrono::system_clock::now()};
    }

    bool contains(const std::vector<std::string> &args, const std::string &value)
    {
        return std::find(args.begin(), args.end(), value) != args.end();
    }

    // Index of the first occurrence of the contiguous sequence, or -1
    long findSequence(const std::vector<std::string> &args, const std::vector<std::string> &seq)
    {
        auto it = std::search(args.begin(), args.end(), seq.begin(), seq.end());
        return it == args.end() ? -1 : static_cast<long>(it - args.begin());
    }
}

TEST(FetchInvocationBuilderTest, DefaultRequestProducesBestVideoPlusAudio)
{
    FetchInvocationBuilder builder;
    FetchRequest request;
    request.url = "https://example.com/watch?v=abc";

    auto args = builder.build(request, makeSession());

    std::vector<std::string> expected = {
        "yt-dlp", "https://example.com/watch?v=abc",
        "-o", "/tmp/downloads/3f2b1c4d-0000-4000-8000-000000000001/%(title)s-%(id)s.%(ext)s",
        "--merge-output-format", "mp4",
        "-f", "bestvideo+bestaudio/best"};
    EXPECT_EQ(args, expected);
    EXPECT_FALSE(contains(args, "-x"));
    EXPECT_FALSE(contains(args, "--audio-format"));
}

TEST(FetchInvocationBuilderTest, UrlIsASingleVerbatimArgument)
{
    FetchInvocationBuilder builder;
    FetchRequest request;
    request.url = "https://example.com/v?a=1&b=two words;$(reboot)";

    auto args = builder.build(request, makeSession());

    ASSERT_GE(args.size(), 2u);
    EXPECT_EQ(args[1], request.url);
    EXPECT_EQ(std::count(args.begin(), args.end(), request.url), 1);
}

TEST(FetchInvocationBuilderTest, AudioOnlyWinsOverCustomQuality)
{
    FetchInvocationBuilder builder;
    FetchRequest request;
    request.url = "https://example.com/a";
    request.format = MediaFormat::MP3;
    request.audio_only = true;
    request.quality = "137+140";

    auto args = builder.build(request, makeSession());

    EXPECT_GE(findSequence(args, {"-x", "--audio-format", "mp3"}), 0);
    EXPECT_FALSE(contains(args, "-f"));
    EXPECT_FALSE(contains(args, "137+140"));
}

TEST(FetchInvocationBuilderTest, CustomQualityIsPassedAsSelector)
{
    FetchInvocationBuilder builder;
    FetchRequest request;
    request.url = "https://example.com/a";
    request.quality = "137+140";

    auto args = builder.build(request, makeSession());
    EXPECT_GE(findSequence(args, {"-f", "137+140"}), 0);
}

TEST(FetchInvocationBuilderTest, WorstSelectsLowestQuality)
{
    FetchInvocationBuilder builder;
    FetchRequest request;
    request.url = "https://example.com/a";
    request.quality = "worst";

    auto args = builder.build(request, makeSession());
    EXPECT_GE(findSequence(args, {"-f", "worstvideo+worstaudio/worst"}), 0);
}

TEST(FetchInvocationBuilderTest, EmptyQualityBehavesLikeBest)
{
    EXPECT_EQ(FetchInvocationBuilder::formatSelectorFor(""), "bestvideo+bestaudio/best");
    EXPECT_EQ(FetchInvocationBuilder::formatSelectorFor("best"), "bestvideo+bestaudio/best");
}

TEST(FetchInvocationBuilderTest, SubtitlesDisabledEmitsNoSubtitleFlags)
{
    FetchInvocationBuilder builder;
    FetchRequest request;
    request.url = "https://example.com/a";
    request.subtitles = false;
    request.subtitle_langs = {"en", "fr"};
    request.embed_subs = true;

    auto args = builder.build(request, makeSession());

    EXPECT_FALSE(contains(args, "--write-subs"));
    EXPECT_FALSE(contains(args, "--sub-langs"));
    EXPECT_FALSE(contains(args, "--embed-subs"));
}

TEST(FetchInvocationBuilderTest, SubtitleLanguagesKeepOrder)
{
    FetchInvocationBuilder builder;
    FetchRequest request;
    request.url = "https://example.com/a";
    request.subtitles = true;
    request.subtitle_langs = {"fr", "en", "de"};
    request.embed_subs = true;

    auto args = builder.build(request, makeSession());
    EXPECT_GE(findSequence(args, {"--write-subs", "--sub-langs", "fr,en,de", "--embed-subs"}), 0);
}

TEST(FetchInvocationBuilderTest, SubtitlesWithoutEmbedding)
{
    FetchInvocationBuilder builder;
    FetchRequest request;
    request.url = "https://example.com/a";
    request.subtitles = true;

    auto args = builder.build(request, makeSession());
    EXPECT_GE(findSequence(args, {"--write-subs", "--sub-langs", "en"}), 0);
    EXPECT_FALSE(contains(args, "--embed-subs"));
}

TEST(FetchInvocationBuilderTest, FilenameTemplateIsRootedInWorkspace)
{
    FetchInvocationBuilder builder;
    FetchRequest request;
    request.url = "https://example.com/a";
    request.filename_template = "clips/%(id)s.%(ext)s";

    auto args = builder.build(request, makeSession());
    EXPECT_GE(findSequence(args, {"-o", "/tmp/downloads/3f2b1c4d-0000-4000-8000-000000000001/clips/%(id)s.%(ext)s"}), 0);
}

TEST(FetchInvocationBuilderTest, DeploymentOptionsAppendToolFlags)
{
    FetchToolOptions options;
    options.tool_binary = "/usr/local/bin/yt-dlp";
    options.ffmpeg_location = "/opt/ffmpeg/bin";
    options.sponsorblock_enabled = true;
    FetchInvocationBuilder builder(options);

    FetchRequest request;
    request.url = "https://example.com/a";
    auto args = builder.build(request, makeSession());

    EXPECT_EQ(args.front(), "/usr/local/bin/yt-dlp");
    std::vector<std::string> tail(args.end() - 4, args.end());
    std::vector<std::string> expected_tail = {"--ffmpeg-location", "/opt/ffmpeg/bin",
                                              "--sponsorblock-remove", "sponsor,intro,outro"};
    EXPECT_EQ(tail, expected_tail);
}

TEST(FetchInvocationBuilderTest, NoDeploymentFlagsByDefault)
{
    FetchInvocationBuilder builder;
    FetchRequest request;
    request.url = "https://example.com/a";
    auto args = builder.build(request, makeSession());

    EXPECT_FALSE(contains(args, "--ffmpeg-location"));
    EXPECT_FALSE(contains(args, "--sponsorblock-remove"));
}

TEST(FetchInvocationBuilderTest, ExtraArgsGoToPostprocessor)
{
    FetchInvocationBuilder builder;
    FetchRequest request;
    request.url = "https://example.com/a";
    request.extra_args = {"-b:a", "192k"};

    auto args = builder.build(request, makeSession());
    EXPECT_GE(findSequence(args, {"--postprocessor-args", "ffmpeg:-b:a 192k"}), 0);
}

TEST(FetchInvocationBuilderTest, PostprocessorArgsFollowSubtitlesAndPrecedeToolOptions)
{
    FetchToolOptions options;
    options.ffmpeg_location = "/opt/ffmpeg";
    FetchInvocationBuilder builder(options);
    FetchRequest request;
    request.url = "https://example.com/a";
    request.subtitles = true;
    request.extra_args = {"-ac", "2"};

    auto args = builder.build(request, makeSession());
    long subs = findSequence(args, {"--write-subs"});
    long post = findSequence(args, {"--postprocessor-args", "ffmpeg:-ac 2"});
    long location = findSequence(args, {"--ffmpeg-location", "/opt/ffmpeg"});
    ASSERT_GE(subs, 0);
    ASSERT_GE(post, 0);
    ASSERT_GE(location, 0);
    EXPECT_LT(subs, post);
    EXPECT_LT(post, location);
}

TEST(FetchInvocationBuilderTest, PostprocessorArgsAreQuotedWhenNeeded)
{
    EXPECT_EQ(FetchInvocationBuilder::joinPostprocessorArgs({"-metadata", "title=My Song"}),
              "-metadata 'title=My Song'");
    EXPECT_EQ(FetchInvocationBuilder::joinPostprocessorArgs({"it's"}), "'it'\"'\"'s'");
    EXPECT_EQ(FetchInvocationBuilder::joinPostprocessorArgs({""}), "''");
}
