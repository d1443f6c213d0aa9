#pragma once

#include <string>
#include <vector>

#include "core/CommitObject.hpp"
#include "core/RevisionRange.hpp"
#include "util/Expected.hpp"

namespace mergereport {

/// Options of a range listing
struct LogFilter {
    std::string path{};          // only commits touching this path; empty = all
    bool oldestFirst{false};     // default order is newest first
    bool excludeMerges{false};
};

/**
 * @brief Read-only query interface over a version-control history
 * 
 * Every question the reporter asks of the history goes through here, so the
 * filtering logic never talks to a backend directly. GitCliQuery implements
 * it with the git executable; tests implement it in memory.
 * 
 * All operations are synchronous and return either a value or an Error.
 * A commit that does not exist, or a parent index past the commit's parent
 * count, is an error (RevisionNotFound), never an empty value.
 */
class HistoryQuery {
public:
    virtual ~HistoryQuery() = default;

    /// Resolve any revision expression to the full hash of a commit
    virtual Expected<std::string> resolveRevision(const std::string& rev) = 0;

    /// Full hashes of merge commits in range, newest first
    virtual Expected<std::vector<std::string>> listMerges(const RevisionRange& range) = 0;

    /// First line of the commit message
    virtual Expected<std::string> getSubject(const std::string& hash) = 0;

    /// Commit message after the subject line, as git's %b renders it
    virtual Expected<std::string> getBody(const std::string& hash) = 0;

    /// Hash of parent number parentIndex (1-based, as in "<hash>^<n>")
    virtual Expected<std::string> resolveParent(const std::string& hash, int parentIndex) = 0;

    /// Commits in range, optionally limited to those touching a path
    virtual Expected<std::vector<CommitSummary>> listCommits(const RevisionRange& range, const LogFilter& filter) = 0;

    /// True if at least one merge commit lies in range
    virtual Expected<bool> hasAnyMerge(const RevisionRange& range) = 0;

    /// Author, date, message and modified files of one commit
    virtual Expected<CommitDetails> getDetails(const std::string& hash) = 0;
};

}
