#pragma once

#include <string>
#include <vector>

namespace mergereport {

/**
 * @brief One line of a range listing: abbreviated hash and subject
 * 
 * Corresponds to git's "%h %s" pretty format.
 */
struct CommitSummary {
    std::string shortHash;
    std::string subject;

    bool operator==(const CommitSummary& other) const {
        return shortHash == other.shortHash && subject == other.subject;
    }
};

/**
 * @brief Merge commit as seen by the report
 * 
 * Only parent positions 1 and 2 matter:
 *   targetParent   - branch that was merged into
 *   incomingParent - tip of the branch that was merged in
 */
struct MergeCommit {
    std::string hash;              // full hash
    std::string subject;           // first line of the message
    std::string body;              // message after the subject, may be empty
    std::string targetParent;
    std::string incomingParent;
};

/**
 * @brief Full metadata of a single commit
 */
struct CommitDetails {
    std::string hash;
    std::string authorName;
    std::string authorEmail;
    std::string date;              // committer date, "YYYY-MM-DD HH:MM:SS +ZZZZ"
    std::string message;           // full raw message
    std::vector<std::string> files;  // paths modified by the commit
};

}
