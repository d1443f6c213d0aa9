#include "core/CommitLister.hpp"

#include "core/ReportFormatter.hpp"
#include "util/Logger.hpp"

namespace mergereport {

CommitLister::CommitLister(HistoryQuery& history, std::ostream& out) : history(history), out(out) {}

Expected<size_t> CommitLister::run(const RevisionRange& range, const std::string& path) {
    auto& log = Logger::instance();
    log.info("Analyzing commits in " + range.toString() + " that modified " + path);

    LogFilter filter;
    filter.path = path;
    filter.excludeMerges = true;
    auto commits = history.listCommits(range, filter);
    if (!commits) {
        return Error{commits.error().code, "cannot list commits in " + range.toString() + ": " + commits.error().message};
    }

    size_t written = 0;
    for (const auto& summary : commits.value()) {
        auto details = history.getDetails(summary.shortHash);
        if (!details) {
            log.warn("skipping " + summary.shortHash + ": " + details.error().message);
            continue;
        }
        ReportFormatter::writeCommit(out, details.value());
        ++written;
    }
    out.flush();

    log.debug("listed " + std::to_string(written) + " commits");
    return written;
}

}
