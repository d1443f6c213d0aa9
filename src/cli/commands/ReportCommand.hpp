#pragma once

#include "cli/ICommand.hpp"

namespace mergereport {

class ReportCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "report"; }
    const char* description() const override { return "Report merges whose incoming branch touched a file"; }
    const char* helpNameLine() const override { return "report -  Show patchset merges that modified a file"; }
    const char* helpSynopsis() const override { return "merge-report [report] --from <rev> --to <rev> --path <file> [--inclusive] [-C <dir>]"; }
    const char* helpDescription() const override {
        return "Walk the merge commits in <from>..<to> and print, for every merge whose incoming branch "
               "modified <file>, its subject, hash, merge message and the commits it brought in (oldest first). "
               "Merges whose branch contains other merges and \"Merge tag\" pulls are skipped.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override;
};

}
