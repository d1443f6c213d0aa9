#pragma once

#include <cstddef>
#include <ostream>
#include <string>

#include "core/HistoryQuery.hpp"
#include "util/Expected.hpp"

namespace mergereport {

/**
 * @brief Lists the individual non-merge commits that touched a path
 * 
 * Newest first, one log-style block per commit with author, date,
 * modified files and the full message.
 */
class CommitLister {
public:
    CommitLister(HistoryQuery& history, std::ostream& out);

    /// @return Number of commits written, or the range listing error
    Expected<size_t> run(const RevisionRange& range, const std::string& path);

private:
    HistoryQuery& history;
    std::ostream& out;
};

}
