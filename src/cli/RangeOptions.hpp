#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "core/GitCliQuery.hpp"
#include "core/RevisionRange.hpp"
#include "util/Expected.hpp"

namespace mergereport {

/// Options shared by commands that scan a revision range for a path
struct RangeOptions {
    std::string from;
    std::string to;
    std::string path;
    bool inclusive{false};               // scan <from>^..<to> instead of <from>..<to>
    std::filesystem::path repoDir{};     // -C <dir>; empty: current directory

    RevisionRange range() const {
        return inclusive ? RevisionRange::inclusive(from, to) : RevisionRange{from, to};
    }
};

/**
 * @brief Parse --from, --to, --path, --inclusive and -C
 * 
 * Accepts both "--opt value" and "--opt=value". Missing required options
 * and unknown arguments are InvalidArgs errors prefixed with the command
 * name.
 */
Expected<RangeOptions> parseRangeOptions(const std::string& command, const std::vector<std::string>& args);

/// Git backend rooted at the repository enclosing the requested directory
struct RangeSession {
    std::unique_ptr<GitCliQuery> history;
    RevisionRange range;
    std::string path;                    // --path relative to the repository root
};

/**
 * @brief Locate the repository and check both ends of the range resolve
 * 
 * A relative -C directory is taken relative to workingDir. A relative
 * --path is taken relative to the -C directory, or workingDir without one,
 * the way git resolves pathspecs from the current directory. Fails with
 * NotARepository, InvalidArgs (path outside the repository) or
 * RevisionNotFound before any scanning starts.
 */
Expected<RangeSession> openRangeSession(const RangeOptions& options, const std::filesystem::path& workingDir);

/// Help text for the shared options
std::vector<std::pair<std::string, std::string>> rangeOptionHelp();

}
