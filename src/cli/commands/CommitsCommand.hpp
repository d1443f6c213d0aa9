#pragma once

#include "cli/ICommand.hpp"

namespace mergereport {

class CommitsCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "commits"; }
    const char* description() const override { return "List non-merge commits that touched a file"; }
    const char* helpNameLine() const override { return "commits -  Show individual commits that modified a file"; }
    const char* helpSynopsis() const override { return "merge-report commits --from <rev> --to <rev> --path <file> [--inclusive] [-C <dir>]"; }
    const char* helpDescription() const override {
        return "List every non-merge commit in <from>..<to> that modified <file>, newest first, "
               "with author, date, modified files and full message.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override;
};

}
