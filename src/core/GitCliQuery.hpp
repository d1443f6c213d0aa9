#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "core/HistoryQuery.hpp"

namespace mergereport {

/**
 * @brief HistoryQuery backed by the git executable
 * 
 * Each operation is one blocking `git` invocation inside the repository
 * directory. Output is requested in fixed pretty formats and parsed here:
 * 
 *   listMerges    log --merges --format=%H <range>
 *   getSubject    show -s --format=%s <hash>
 *   getBody       show -s --format=%b <hash>
 *   resolveParent rev-parse --verify --quiet <hash>^<n>
 *   listCommits   log [--reverse] [--no-merges] --format=%h%x09%s <range> [-- <path>]
 *   hasAnyMerge   rev-list --merges --max-count=1 <range>
 * 
 * The pager is always disabled (--no-pager and GIT_PAGER=cat) and commit
 * signatures are never shown, so output is stable for parsing.
 */
class GitCliQuery : public HistoryQuery {
public:
    /**
     * @param repoDir Repository working directory (or any directory inside it)
     * @param gitExecutable git binary; defaults to MERGE_REPORT_GIT or "git"
     */
    explicit GitCliQuery(std::filesystem::path repoDir, std::string gitExecutable = defaultGitExecutable());

    /// Value of MERGE_REPORT_GIT if set and non-empty, else "git"
    static std::string defaultGitExecutable();

    Expected<std::string> resolveRevision(const std::string& rev) override;
    Expected<std::vector<std::string>> listMerges(const RevisionRange& range) override;
    Expected<std::string> getSubject(const std::string& hash) override;
    Expected<std::string> getBody(const std::string& hash) override;
    Expected<std::string> resolveParent(const std::string& hash, int parentIndex) override;
    Expected<std::vector<CommitSummary>> listCommits(const RevisionRange& range, const LogFilter& filter) override;
    Expected<bool> hasAnyMerge(const RevisionRange& range) override;
    Expected<CommitDetails> getDetails(const std::string& hash) override;

    /**
     * @brief Run git with the given arguments and return its stdout
     * 
     * A non-zero exit status becomes CommandFailed (RevisionNotFound when
     * git complains about an unknown or bad revision) carrying git's stderr.
     */
    Expected<std::string> git(const std::vector<std::string>& args) const;

    const std::filesystem::path& repoDir() const { return repo; }

private:
    std::filesystem::path repo;
    std::string gitExecutable;
};

}
