#pragma once

#include <vector>

#include "cli/ICommand.hpp"

namespace mergereport {

class CommandInvoker {
public:
    /// Run cmd; a failure is logged as "<command>: <message>" and returned
    Expected<void> invoke(ICommand& cmd, const AppContext& ctx, const std::vector<std::string>& args);

    /// Process exit status for a command result: 0 on success, 1 otherwise
    static int exitCode(const Expected<void>& result) { return result ? 0 : 1; }
};

}
