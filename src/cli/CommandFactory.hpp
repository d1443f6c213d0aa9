#pragma once

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "cli/ICommand.hpp"

namespace mergereport {

/**
 * @brief Registry of command creators keyed by command name
 * 
 * One command may be marked as the default; it runs when the command line
 * starts with an option instead of a command name, so
 * `merge-report --from A --to B --path F` means `merge-report report ...`.
 */
class CommandFactory {
public:
    using Creator = std::function<std::unique_ptr<ICommand>()>;

    static CommandFactory& instance();
    void registerCreator(const std::string& name, Creator creator);
    void setDefaultCommand(const std::string& name);
    std::unique_ptr<ICommand> create(const std::string& name) const;
    void listCommands(std::vector<std::unique_ptr<ICommand>>& out) const;

    /**
     * @brief Split a command line into command name and its arguments
     * 
     * Empty command line: "help". Leading option: the default command with
     * all arguments. Otherwise the first argument names the command.
     */
    std::pair<std::string, std::vector<std::string>> resolve(const std::vector<std::string>& args) const;

private:
    CommandFactory() = default;
    std::unordered_map<std::string, Creator> creators;
    std::string defaultCommand{"help"};
};

}
