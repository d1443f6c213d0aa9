#include "core/GitCliQuery.hpp"

#include <cstdlib>
#include <sstream>

#include "core/Constants.hpp"
#include "util/Process.hpp"

namespace mergereport {

namespace {

    /// Drop the single newline git appends after each formatted commit
    std::string stripTerminator(std::string text) {
        if (!text.empty() && text.back() == '\n') text.pop_back();
        return text;
    }

    std::string trim(const std::string& text) {
        size_t begin = text.find_first_not_of(" \t\r\n");
        if (begin == std::string::npos) return std::string();
        size_t end = text.find_last_not_of(" \t\r\n");
        return text.substr(begin, end - begin + 1);
    }

    std::vector<std::string> splitLines(const std::string& text) {
        std::vector<std::string> lines;
        std::istringstream iss(text);
        std::string line;
        while (std::getline(iss, line)) {
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (!line.empty()) lines.push_back(line);
        }
        return lines;
    }

    std::string firstLine(const std::string& text) {
        std::string t = trim(text);
        size_t nl = t.find('\n');
        return nl == std::string::npos ? t : t.substr(0, nl);
    }

    std::string joinArgs(const std::vector<std::string>& args) {
        std::string out;
        for (const auto& a : args) {
            if (!out.empty()) out += ' ';
            out += a;
        }
        return out;
    }

    /// Revisions must not be mistaken for git options
    Expected<void> checkRevision(const std::string& rev) {
        if (rev.empty()) return Error{ErrorCode::InvalidArgs, "empty revision"};
        if (rev.front() == '-') return Error{ErrorCode::InvalidArgs, "invalid revision: " + rev};
        return {};
    }

    Expected<void> checkRange(const RevisionRange& range) {
        auto from = checkRevision(range.from);
        if (!from) return from;
        return checkRevision(range.to);
    }

}

GitCliQuery::GitCliQuery(std::filesystem::path repoDir, std::string gitExecutable)
    : repo(std::move(repoDir)), gitExecutable(std::move(gitExecutable)) {}

std::string GitCliQuery::defaultGitExecutable() {
    const char* env = std::getenv(Constants::ENV_GIT_EXECUTABLE);
    if (env && *env) return env;
    return Constants::DEFAULT_GIT_EXECUTABLE;
}

Expected<std::string> GitCliQuery::git(const std::vector<std::string>& args) const {
    std::vector<std::string> argv{gitExecutable, "--no-pager",
                                  "-c", "log.showSignature=false",
                                  "-c", "core.quotePath=false"};
    argv.insert(argv.end(), args.begin(), args.end());

    ProcessOptions options;
    options.workingDir = repo;
    options.env = {{"GIT_PAGER", "cat"}, {"LC_ALL", "C"}};

    auto res = Process::run(argv, options);
    if (!res) return Error{res.error().code, res.error().message};

    const ProcessResult& pr = res.value();
    if (!pr.succeeded()) {
        std::string detail = firstLine(pr.stderrText);
        std::string message = "git " + joinArgs(args) + " exited with status " + std::to_string(pr.exitCode);
        if (!detail.empty()) message += ": " + detail;
        bool badRevision = pr.stderrText.find("unknown revision") != std::string::npos ||
                           pr.stderrText.find("bad revision") != std::string::npos ||
                           pr.stderrText.find("Needed a single revision") != std::string::npos;
        return Error{badRevision ? ErrorCode::RevisionNotFound : ErrorCode::CommandFailed, message};
    }
    return pr.stdoutText;
}

Expected<std::string> GitCliQuery::resolveRevision(const std::string& rev) {
    auto ok = checkRevision(rev);
    if (!ok) return Error{ok.error().code, ok.error().message};

    auto out = git({"rev-parse", "--verify", "--quiet", rev + "^{commit}"});
    if (!out) {
        if (out.error().code == ErrorCode::ProcessError) return out;
        return Error{ErrorCode::RevisionNotFound, "unknown revision: " + rev};
    }
    std::string hash = trim(out.value());
    if (hash.empty()) return Error{ErrorCode::RevisionNotFound, "unknown revision: " + rev};
    return hash;
}

Expected<std::vector<std::string>> GitCliQuery::listMerges(const RevisionRange& range) {
    auto ok = checkRange(range);
    if (!ok) return Error{ok.error().code, ok.error().message};

    auto out = git({"log", "--merges", "--format=%H", range.toString()});
    if (!out) return Error{out.error().code, out.error().message};
    return splitLines(out.value());
}

Expected<std::string> GitCliQuery::getSubject(const std::string& hash) {
    auto out = git({"show", "-s", "--format=%s", hash});
    if (!out) return Error{out.error().code, out.error().message};
    return stripTerminator(out.value());
}

Expected<std::string> GitCliQuery::getBody(const std::string& hash) {
    auto out = git({"show", "-s", "--format=%b", hash});
    if (!out) return Error{out.error().code, out.error().message};
    return stripTerminator(out.value());
}

Expected<std::string> GitCliQuery::resolveParent(const std::string& hash, int parentIndex) {
    if (parentIndex < 1) {
        return Error{ErrorCode::InvalidArgs, "parent index must be at least 1"};
    }
    auto out = git({"rev-parse", "--verify", "--quiet", hash + "^" + std::to_string(parentIndex)});
    if (!out && out.error().code == ErrorCode::ProcessError) return out;
    std::string parent = out ? trim(out.value()) : std::string();
    if (parent.empty()) {
        return Error{ErrorCode::RevisionNotFound, hash + " has no parent " + std::to_string(parentIndex)};
    }
    return parent;
}

Expected<std::vector<CommitSummary>> GitCliQuery::listCommits(const RevisionRange& range, const LogFilter& filter) {
    auto ok = checkRange(range);
    if (!ok) return Error{ok.error().code, ok.error().message};

    std::vector<std::string> args{"log"};
    if (filter.oldestFirst) args.push_back("--reverse");
    if (filter.excludeMerges) args.push_back("--no-merges");
    args.push_back("--format=%h%x09%s");
    args.push_back(range.toString());
    if (!filter.path.empty()) {
        args.push_back("--");
        args.push_back(filter.path);
    }

    auto out = git(args);
    if (!out) return Error{out.error().code, out.error().message};

    std::vector<CommitSummary> commits;
    for (const auto& line : splitLines(out.value())) {
        size_t tab = line.find('\t');
        if (tab == std::string::npos) {
            // An empty subject still yields the tab; anything else is malformed
            return Error{ErrorCode::ParseError, "unexpected git log line: " + line};
        }
        commits.push_back(CommitSummary{line.substr(0, tab), line.substr(tab + 1)});
    }
    return commits;
}

Expected<bool> GitCliQuery::hasAnyMerge(const RevisionRange& range) {
    auto ok = checkRange(range);
    if (!ok) return Error{ok.error().code, ok.error().message};

    auto out = git({"rev-list", "--merges", "--max-count=1", range.toString()});
    if (!out) return Error{out.error().code, out.error().message};
    return !trim(out.value()).empty();
}

Expected<CommitDetails> GitCliQuery::getDetails(const std::string& hash) {
    auto meta = git({"show", "-s", "--format=%H%x00%an%x00%ae%x00%ci%x00%B", hash});
    if (!meta) return Error{meta.error().code, meta.error().message};

    // Five NUL separated fields; the message is last and may contain anything but NUL
    std::vector<std::string> fields;
    const std::string& text = meta.value();
    size_t start = 0;
    for (int i = 0; i < 4; ++i) {
        size_t nul = text.find('\0', start);
        if (nul == std::string::npos) {
            return Error{ErrorCode::ParseError, "malformed commit metadata for " + hash};
        }
        fields.push_back(text.substr(start, nul - start));
        start = nul + 1;
    }

    CommitDetails details;
    details.hash = fields[0];
    details.authorName = fields[1];
    details.authorEmail = fields[2];
    details.date = fields[3];
    details.message = stripTerminator(text.substr(start));
    while (!details.message.empty() && details.message.back() == '\n') details.message.pop_back();

    auto files = git({"show", "--name-only", "--format=", hash});
    if (!files) return Error{files.error().code, files.error().message};
    details.files = splitLines(files.value());
    return details;
}

}
