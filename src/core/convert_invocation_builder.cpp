#include "core/convert_invocation_builder.hpp"
#include "logging/logger.hpp"
#include <filesystem>

ConvertInvocationBuilder::ConvertInvocationBuilder(std::string tool_binary)
    : tool_binary_(std::move(tool_binary))
{
}

std::string ConvertInvocationBuilder::outputPathFor(const std::string &input_path, MediaFormat format)
{
    std::filesystem::path base(input_path);
    base.replace_extension();
    return base.string() + "_conv." + MediaFormats::getName(format);
}

ConvertInvocation ConvertInvocationBuilder::build(const ConvertRequest &request) const
{
    std::error_code ec;
    if (!std::filesystem::exists(request.input_path, ec))
    {
        Logger::warn("ConvertInvocationBuilder: input not found: " + request.input_path);
        throw InputNotFound(request.input_path);
    }

    ConvertInvocation invocation;
    invocation.output_path = outputPathFor(request.input_path, request.output_format);

    // Timestamps are passed through untouched; the tool reports bad ones
    invocation.args = {tool_binary_, "-y", "-i", request.input_path};
    if (request.start)
        invocation.args.insert(invocation.args.end(), {"-ss", *request.start});
    if (request.end)
        invocation.args.insert(invocation.args.end(), {"-to", *request.end});
    invocation.args.insert(invocation.args.end(), request.extra_args.begin(), request.extra_args.end());
    invocation.args.push_back(invocation.output_path);

    return invocation;
}
