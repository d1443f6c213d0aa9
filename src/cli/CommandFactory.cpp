#include "cli/CommandFactory.hpp"

#include <algorithm>

namespace mergereport {

CommandFactory& CommandFactory::instance() {
    static CommandFactory f;
    return f;
}

void CommandFactory::registerCreator(const std::string& name, Creator creator) {
    creators[name] = std::move(creator);
}

void CommandFactory::setDefaultCommand(const std::string& name) {
    defaultCommand = name;
}

std::unique_ptr<ICommand> CommandFactory::create(const std::string& name) const {
    auto it = creators.find(name);
    if (it == creators.end()) return nullptr;
    return it->second();
}

void CommandFactory::listCommands(std::vector<std::unique_ptr<ICommand>>& out) const {
    out.clear();
    out.reserve(creators.size());
    for (const auto& kv : creators) {
        out.emplace_back(kv.second());
    }
    std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
        return std::string(a->name()) < std::string(b->name());
    });
}

std::pair<std::string, std::vector<std::string>> CommandFactory::resolve(const std::vector<std::string>& args) const {
    if (args.empty()) return {"help", {}};
    const std::string& first = args.front();
    if (!first.empty() && first.front() == '-' && first != "-h" && first != "--help") {
        return {defaultCommand, args};
    }
    if (first == "-h" || first == "--help") return {"help", {}};
    return {first, std::vector<std::string>(args.begin() + 1, args.end())};
}

}
