#include "cli/RangeOptions.hpp"

#include "core/Repository.hpp"
#include "util/Logger.hpp"

namespace fs = std::filesystem;

namespace mergereport {

namespace {

    /// Split "--opt=value"; returns false if arg carries no inline value
    bool splitInline(const std::string& arg, std::string& key, std::string& value) {
        size_t eq = arg.find('=');
        if (arg.rfind("--", 0) != 0 || eq == std::string::npos) return false;
        key = arg.substr(0, eq);
        value = arg.substr(eq + 1);
        return true;
    }

    fs::path withoutTrailingSeparator(fs::path p) {
        if (!p.has_filename() && p.has_relative_path()) p = p.parent_path();
        return p;
    }

    /// Resolve a user path against base and express it relative to root
    Expected<std::string> toRepositoryPath(const std::string& path, const fs::path& base, const fs::path& root) {
        fs::path given(path);
        fs::path full = withoutTrailingSeparator((given.is_absolute() ? given : base / given).lexically_normal());
        fs::path rel = full.lexically_relative(withoutTrailingSeparator(root));
        std::string text = rel.generic_string();
        if (text.empty() || text == ".." || text.rfind("../", 0) == 0) {
            return Error{ErrorCode::InvalidArgs, "--path " + path + " is outside repository " + root.string()};
        }
        return text;
    }

}

Expected<RangeOptions> parseRangeOptions(const std::string& command, const std::vector<std::string>& args) {
    RangeOptions opts;
    for (size_t i = 0; i < args.size(); ++i) {
        std::string key = args[i];
        std::string value;
        bool hasValue = splitInline(args[i], key, value);

        if (key == "--inclusive") {
            if (hasValue) return Error{ErrorCode::InvalidArgs, command + ": --inclusive takes no value"};
            opts.inclusive = true;
            continue;
        }

        std::string* target = nullptr;
        if (key == "--from") target = &opts.from;
        else if (key == "--to") target = &opts.to;
        else if (key == "--path") target = &opts.path;

        if (target || key == "-C") {
            if (!hasValue) {
                if (i + 1 >= args.size()) {
                    return Error{ErrorCode::InvalidArgs, command + ": " + key + " requires a value"};
                }
                value = args[++i];
            }
            if (value.empty()) {
                return Error{ErrorCode::InvalidArgs, command + ": " + key + " must not be empty"};
            }
            if (target) *target = value;
            else opts.repoDir = value;
            continue;
        }

        return Error{ErrorCode::InvalidArgs, command + ": unknown argument '" + args[i] + "'"};
    }

    if (opts.from.empty()) return Error{ErrorCode::InvalidArgs, command + ": --from <rev> is required"};
    if (opts.to.empty()) return Error{ErrorCode::InvalidArgs, command + ": --to <rev> is required"};
    if (opts.path.empty()) return Error{ErrorCode::InvalidArgs, command + ": --path <file> is required"};
    return opts;
}

Expected<RangeSession> openRangeSession(const RangeOptions& options, const fs::path& workingDir) {
    fs::path start = workingDir;
    if (!options.repoDir.empty()) {
        start = options.repoDir.is_absolute() ? options.repoDir : workingDir / options.repoDir;
    }
    auto rootRes = Repository::discoverRoot(start);
    if (!rootRes) return Error{rootRes.error().code, rootRes.error().message};

    std::error_code ec;
    fs::path base = fs::absolute(start, ec);
    if (ec) return Error{ErrorCode::InvalidArgs, "cannot resolve " + start.string() + ": " + ec.message()};
    auto pathRes = toRepositoryPath(options.path, base, rootRes.value());
    if (!pathRes) return Error{pathRes.error().code, pathRes.error().message};

    RangeSession session;
    session.history = std::make_unique<GitCliQuery>(rootRes.value());
    session.range = options.range();
    session.path = pathRes.value();
    Logger::instance().debug("repository: " + rootRes.value().string() + ", path: " + session.path);

    for (const auto& rev : {options.from, options.to}) {
        auto resolved = session.history->resolveRevision(rev);
        if (!resolved) return Error{resolved.error().code, resolved.error().message};
        Logger::instance().debug(rev + " -> " + resolved.value());
    }
    if (options.inclusive) {
        // <from>^ must exist too, i.e. from is not a root commit
        auto parent = session.history->resolveRevision(session.range.from);
        if (!parent) {
            return Error{ErrorCode::RevisionNotFound, "--inclusive: " + options.from + " has no parent"};
        }
    }
    return session;
}

std::vector<std::pair<std::string, std::string>> rangeOptionHelp() {
    return {
        {"--from <rev>", "Start of the range; commits reachable from <rev> are not considered."},
        {"--to <rev>", "End of the range."},
        {"--path <file>", "File of interest, relative to the current directory (or to <dir> with -C)."},
        {"--inclusive", "Consider <from> itself as well (scan <from>^..<to>)."},
        {"-C <dir>", "Run against the repository containing <dir> instead of the current directory."},
    };
}

}
