#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

#include "core/CommitObject.hpp"
#include "core/HistoryQuery.hpp"
#include "core/RevisionRange.hpp"
#include "util/Expected.hpp"

namespace mergereport {

/// Outcome of running one merge through the filter gates
enum class MergeVerdict {
    Included,
    NotAMerge,      // second parent does not resolve
    NestedMerge,    // incoming range already contains a merge
    TagPull,        // subject contains "Merge tag"
    Irrelevant,     // incoming range never touches the path
    QueryFailed     // a history query failed or returned nothing usable
};

const char* toString(MergeVerdict verdict);

struct MergeEvaluation {
    MergeVerdict verdict{MergeVerdict::QueryFailed};
    MergeCommit merge{};
    std::vector<CommitSummary> patches{};  // filled only for Included, oldest first
    std::string reason{};                  // detail for QueryFailed
};

struct ReportStats {
    size_t scanned{0};
    size_t included{0};
};

/**
 * @brief Finds merges whose incoming branch touched a path and reports them
 * 
 * For every merge in the range (newest first) the gates run in order and the
 * first failing one excludes the merge:
 *   1. subject and both parents resolve      (else NotAMerge / QueryFailed)
 *   2. parent1..parent2 holds no merge        (else NestedMerge)
 *   3. subject lacks "Merge tag"              (else TagPull)
 *   4. parent1..parent2 touches the path      (else Irrelevant)
 * 
 * Per-merge query failures only exclude that merge. A failure to enumerate
 * the overall range is returned as an error.
 */
class MergeReporter {
public:
    MergeReporter(HistoryQuery& history, std::ostream& out);

    /**
     * @brief Write a report block for each qualifying merge in range
     * @param range Merges considered (reachable from range.to, not range.from)
     * @param path File of interest
     * @return Scan statistics, or the enumeration error
     */
    Expected<ReportStats> run(const RevisionRange& range, const std::string& path);

    /// Run the gates for a single merge and, if included, collect its body and patches
    MergeEvaluation evaluate(const std::string& mergeHash, const std::string& path);

    /// Subject heuristic for merges pulling a whole tagged release
    static bool isTagPull(const std::string& subject);

private:
    HistoryQuery& history;
    std::ostream& out;
};

}
