#pragma once

#include "core/media_requests.hpp"
#include <stdexcept>
#include <string>
#include <vector>

/**
 * @brief Raised when a request references a local file that does not exist
 */
class InputNotFound : public std::runtime_error
{
public:
    explicit InputNotFound(const std::string &path, const std::string &message = "Input file not found")
        : std::runtime_error(message), path_(path) {}

    const std::string &path() const { return path_; }

private:
    std::string path_;
};

struct ConvertInvocation
{
    std::vector<std::string> args;
    std::string output_path;
};

/**
 * @brief Translates a ConvertRequest into the transcode tool's argument list
 *
 * The output lands next to the input as "<input without extension>_conv.<format>".
 * The tool runs with -y, so repeating a conversion overwrites the previous output.
 */
class ConvertInvocationBuilder
{
public:
    explicit ConvertInvocationBuilder(std::string tool_binary = "ffmpeg");

    /**
     * @throws InputNotFound if request.input_path does not exist
     */
    ConvertInvocation build(const ConvertRequest &request) const;

    static std::string outputPathFor(const std::string &input_path, MediaFormat format);

private:
    std::string tool_binary_;
};
