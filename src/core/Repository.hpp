#pragma once

#include <filesystem>

#include "util/Expected.hpp"

namespace mergereport {

/**
 * @brief Locates the git working tree the tool runs against
 * 
 * A directory is a repository root when it contains a `.git` entry, either
 * the usual directory or the `gitdir:` file linked worktrees and submodules
 * use.
 */
class Repository {
public:
    /**
     * @brief Find repository root by searching upwards for .git
     * @param start Starting directory (usually current working directory)
     * @return Absolute path to repository root, or NotARepository
     * 
     * Walks up the directory tree until .git is found or the filesystem
     * root is reached.
     */
    static Expected<std::filesystem::path> discoverRoot(const std::filesystem::path& start);

    /// True if dir directly contains a .git directory or file
    static bool isRepositoryRoot(const std::filesystem::path& dir);
};

}
