#include "cli/commands/ReportCommand.hpp"

#include "cli/RangeOptions.hpp"
#include "core/MergeReporter.hpp"

namespace mergereport {

std::vector<std::pair<std::string, std::string>> ReportCommand::helpOptions() const {
    return rangeOptionHelp();
}

/**
 * @brief Execute 'merge-report report'
 * 
 * Resolves the repository and both revisions first; any failure there is
 * returned before output starts. The exit status does not depend on how
 * many merges matched.
 */
Expected<void> ReportCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    auto opts = parseRangeOptions(name(), args);
    if (!opts) return Error{opts.error().code, opts.error().message};

    auto session = openRangeSession(opts.value(), ctx.workingDir());
    if (!session) return Error{session.error().code, session.error().message};

    MergeReporter reporter(*session.value().history, ctx.output());
    auto stats = reporter.run(session.value().range, session.value().path);
    if (!stats) return Error{stats.error().code, stats.error().message};
    return {};
}

}
