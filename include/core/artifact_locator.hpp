#pragma once

#include "core/session_workspace.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Finds the media file a fetch produced inside its session workspace
 *
 * The walk is deterministic for a given directory state: in each directory
 * files are checked in lexical order before descending into subdirectories
 * (also lexical). When nothing matches, the workspace directory itself is
 * returned; callers treat a directory result as "artifact undetermined".
 */
class ArtifactLocator
{
public:
    ArtifactLocator();
    explicit ArtifactLocator(std::vector<std::string> extensions);

    std::filesystem::path locate(const Session &session) const;
    std::filesystem::path locate(const std::filesystem::path &workspace_dir) const;

    bool isArtifactName(const std::string &file_name) const;

private:
    std::optional<std::filesystem::path> findIn(const std::filesystem::path &dir) const;

    std::vector<std::string> extensions_;
};
