#include "cli/commands/HelpCommand.hpp"

#include <memory>
#include <string>
#include <vector>

#include "cli/CommandFactory.hpp"
#include "core/Constants.hpp"
#include "util/Logger.hpp"

namespace mergereport {

namespace {

void printCommandDetail(std::ostream& out, const ICommand& cmd) {
    out << "NAME:\n" << cmd.helpNameLine() << "\n\n";
    out << "SYNOPSIS:\n" << cmd.helpSynopsis() << "\n\n";
    out << "DESCRIPTION:\n" << cmd.helpDescription() << "\n\n";
    auto opts = cmd.helpOptions();
    if (!opts.empty()) {
        out << "OPTIONS:\n";
        for (const auto& [opt, desc] : opts) {
            out << "  " << opt << "\n      " << desc << "\n";
        }
        out << "\n";
    }
}

}

Expected<void> HelpCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    std::ostream& out = ctx.output();
    if (!args.empty()) {
        std::string topic = args.front();
        auto cmd = CommandFactory::instance().create(topic);
        if (cmd) {
            printCommandDetail(out, *cmd);
            return {};
        }
        Logger::instance().warn("Unknown help topic: " + topic);
    }

    std::vector<std::unique_ptr<ICommand>> cmds;
    CommandFactory::instance().listCommands(cmds);

    out << "usage: merge-report [<command>] [<options>]\n\n";
    out << "Commands:\n";
    for (const auto& c : cmds) {
        out << "  " << c->name() << "\t" << c->description() << "\n";
    }
    out << "\nWithout a command name, options go to 'report'.\n";
    out << "Environment: " << Constants::ENV_LOG_LEVEL << "=error|warn|info|debug, "
        << Constants::ENV_GIT_EXECUTABLE << "=<path to git>\n";
    return {};
}

}
