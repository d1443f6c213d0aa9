#pragma once

#include <filesystem>
#include <iostream>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "util/Expected.hpp"

namespace mergereport {

/// Per-invocation environment handed to every command
struct AppContext {
    std::ostream* out{&std::cout};   // report output; logs never go here
    std::filesystem::path cwd{};     // empty: the process working directory

    std::ostream& output() const { return *out; }
    std::filesystem::path workingDir() const { return cwd.empty() ? std::filesystem::current_path() : cwd; }
};

class ICommand {
public:
    virtual ~ICommand() = default;
    virtual Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) = 0;
    virtual const char* name() const = 0;
    virtual const char* description() const = 0;
    // Detailed help getters
    virtual const char* helpNameLine() const = 0;      // "<cmd> - <one line>"
    virtual const char* helpSynopsis() const = 0;      // usage synopsis
    virtual const char* helpDescription() const = 0;   // long description
    virtual std::vector<std::pair<std::string, std::string>> helpOptions() const = 0; // flag -> description
};

}
