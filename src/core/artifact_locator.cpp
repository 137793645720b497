#include "core/artifact_locator.hpp"
#include "core/media_format.hpp"
#include "logging/logger.hpp"
#include <algorithm>

namespace fs = std::filesystem;

ArtifactLocator::ArtifactLocator()
    : extensions_(MediaFormats::artifactExtensions())
{
}

ArtifactLocator::ArtifactLocator(std::vector<std::string> extensions)
    : extensions_(std::move(extensions))
{
}

bool ArtifactLocator::isArtifactName(const std::string &file_name) const
{
    for (const auto &ext : extensions_)
    {
        if (file_name.size() >= ext.size() &&
            file_name.compare(file_name.size() - ext.size(), ext.size(), ext) == 0)
        {
            return true;
        }
    }
    return false;
}

fs::path ArtifactLocator::locate(const Session &session) const
{
    return locate(session.workspace_dir);
}

fs::path ArtifactLocator::locate(const fs::path &workspace_dir) const
{
    auto found = findIn(workspace_dir);
    if (found)
    {
        Logger::debug("ArtifactLocator: found " + found->string());
        return *found;
    }

    Logger::warn("ArtifactLocator: no media file in " + workspace_dir.string() + ", returning the directory");
    return workspace_dir;
}

std::optional<fs::path> ArtifactLocator::findIn(const fs::path &dir) const
{
    std::vector<fs::path> files;
    std::vector<fs::path> subdirs;

    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec)
    {
        Logger::warn("ArtifactLocator: cannot read " + dir.string() + ": " + ec.message());
        return std::nullopt;
    }

    for (; it != fs::directory_iterator(); it.increment(ec))
    {
        if (ec)
            break;
        std::error_code entry_ec;
        if (it->is_directory(entry_ec))
            subdirs.push_back(it->path());
        else if (it->is_regular_file(entry_ec))
            files.push_back(it->path());
    }

    std::sort(files.begin(), files.end());
    for (const auto &file : files)
    {
        if (isArtifactName(file.filename().string()))
            return file;
    }

    std::sort(subdirs.begin(), subdirs.end());
    for (const auto &subdir : subdirs)
    {
        auto found = findIn(subdir);
        if (found)
            return found;
    }
    return std::nullopt;
}
