#pragma once

#include <ostream>
#include <vector>

#include "core/CommitObject.hpp"

namespace mergereport {

/**
 * @brief Plain-text rendering of report entries
 * 
 * Merge block layout (consumed by downstream tooling, keep byte-exact):
 * 
 *   =================================================================
 *   MERGE: <subject>
 *   HASH: <full hash>
 *   
 *   COVER LETTER / MERGE MESSAGE:
 *   <body as git's %b prints it>
 *   
 *   PATCHES:
 *     <short-hash> <subject>
 *   
 */
class ReportFormatter {
public:
    static void writeMerge(std::ostream& out, const MergeCommit& merge, const std::vector<CommitSummary>& patches);

    /// Log-style block for one commit: hash, author, date, files, indented message
    static void writeCommit(std::ostream& out, const CommitDetails& commit);
};

}
