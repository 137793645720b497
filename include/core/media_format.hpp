#pragma once

#include <optional>
#include <string>
#include <vector>

/**
 * @brief Container/codec targets accepted by the fetch and convert operations
 */
enum class MediaFormat
{
    MP3,
    MP4,
    WAV,
    MKV,
    WEBM,
    M4A,
    OPUS
};

class MediaFormats
{
public:
    /**
     * @brief Get the format name as used on the wire and as a file extension
     * @param format The media format
     * @return Lower-case name, e.g. "mp4"
     */
    static std::string getName(MediaFormat format)
    {
        switch (format)
        {
        case MediaFormat::MP3:
            return "mp3";
        case MediaFormat::MP4:
            return "mp4";
        case MediaFormat::WAV:
            return "wav";
        case MediaFormat::MKV:
            return "mkv";
        case MediaFormat::WEBM:
            return "webm";
        case MediaFormat::M4A:
            return "m4a";
        case MediaFormat::OPUS:
            return "opus";
        default:
            return "unknown";
        }
    }

    /**
     * @brief Convert a wire name to MediaFormat
     * @param name Lower-case format name
     * @return The format, or std::nullopt if the name is not one of the fixed set
     */
    static std::optional<MediaFormat> fromString(const std::string &name)
    {
        for (MediaFormat format : all())
        {
            if (getName(format) == name)
                return format;
        }
        return std::nullopt;
    }

    static std::string getMimeType(MediaFormat format)
    {
        switch (format)
        {
        case MediaFormat::MP3:
            return "audio/mpeg";
        case MediaFormat::MP4:
            return "video/mp4";
        case MediaFormat::WAV:
            return "audio/wav";
        case MediaFormat::MKV:
            return "video/x-matroska";
        case MediaFormat::WEBM:
            return "video/webm";
        case MediaFormat::M4A:
            return "audio/mp4";
        case MediaFormat::OPUS:
            return "audio/ogg";
        default:
            return "application/octet-stream";
        }
    }

    static const std::vector<MediaFormat> &all()
    {
        static const std::vector<MediaFormat> formats = {
            MediaFormat::MP3, MediaFormat::MP4, MediaFormat::WAV, MediaFormat::MKV,
            MediaFormat::WEBM, MediaFormat::M4A, MediaFormat::OPUS};
        return formats;
    }

    /**
     * @brief File suffixes that identify a finished media artifact
     *
     * Order matters only for logging; matching is by suffix.
     */
    static const std::vector<std::string> &artifactExtensions()
    {
        static const std::vector<std::string> extensions = {
            ".mp4", ".mp3", ".mkv", ".webm", ".m4a", ".opus", ".wav"};
        return extensions;
    }
};
