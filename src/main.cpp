// merge-report entry point: command registry plus dispatch.

#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "cli/CommandFactory.hpp"
#include "cli/CommandInvoker.hpp"
#include "cli/ICommand.hpp"
#include "cli/commands/CommitsCommand.hpp"
#include "cli/commands/HelpCommand.hpp"
#include "cli/commands/ReportCommand.hpp"
#include "util/Logger.hpp"

using namespace mergereport;

static void registerCommands() {
    auto& f = CommandFactory::instance();
    f.registerCreator("help", [] { return std::make_unique<HelpCommand>(); });
    f.registerCreator("report", [] { return std::make_unique<ReportCommand>(); });
    f.registerCreator("commits", [] { return std::make_unique<CommitsCommand>(); });
    f.setDefaultCommand("report");
}

int main(int argc, char** argv) {
    registerCommands();
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);
    AppContext ctx{};
    CommandInvoker invoker;

    auto [cmdName, cmdArgs] = CommandFactory::instance().resolve(args);
    auto cmd = CommandFactory::instance().create(cmdName);
    if (!cmd) {
        Logger::instance().error("Unknown command: " + cmdName);
        auto help = CommandFactory::instance().create("help");
        invoker.invoke(*help, ctx, {});
        return 1;
    }
    auto res = invoker.invoke(*cmd, ctx, cmdArgs);
    return CommandInvoker::exitCode(res);
}
