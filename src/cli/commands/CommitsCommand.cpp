#include "cli/commands/CommitsCommand.hpp"

#include "cli/RangeOptions.hpp"
#include "core/CommitLister.hpp"

namespace mergereport {

std::vector<std::pair<std::string, std::string>> CommitsCommand::helpOptions() const {
    return rangeOptionHelp();
}

Expected<void> CommitsCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    auto opts = parseRangeOptions(name(), args);
    if (!opts) return Error{opts.error().code, opts.error().message};

    auto session = openRangeSession(opts.value(), ctx.workingDir());
    if (!session) return Error{session.error().code, session.error().message};

    CommitLister lister(*session.value().history, ctx.output());
    auto written = lister.run(session.value().range, session.value().path);
    if (!written) return Error{written.error().code, written.error().message};
    return {};
}

}
