#include "core/MergeReporter.hpp"

#include "core/Constants.hpp"
#include "core/ReportFormatter.hpp"
#include "util/Logger.hpp"

namespace mergereport {

namespace {

    MergeEvaluation failed(MergeEvaluation eval, const std::string& what, const Error& err) {
        eval.verdict = MergeVerdict::QueryFailed;
        eval.reason = what + ": " + err.message;
        return eval;
    }

    MergeEvaluation rejected(MergeEvaluation eval, MergeVerdict verdict) {
        eval.verdict = verdict;
        return eval;
    }

}

const char* toString(MergeVerdict verdict) {
    switch (verdict) {
        case MergeVerdict::Included: return "included";
        case MergeVerdict::NotAMerge: return "not a merge";
        case MergeVerdict::NestedMerge: return "contains nested merges";
        case MergeVerdict::TagPull: return "tag pull";
        case MergeVerdict::Irrelevant: return "does not touch path";
        case MergeVerdict::QueryFailed: return "query failed";
    }
    return "unknown";
}

MergeReporter::MergeReporter(HistoryQuery& history, std::ostream& out) : history(history), out(out) {}

bool MergeReporter::isTagPull(const std::string& subject) {
    return subject.find(Constants::TAG_PULL_MARKER) != std::string::npos;
}

MergeEvaluation MergeReporter::evaluate(const std::string& mergeHash, const std::string& path) {
    MergeEvaluation eval;
    eval.merge.hash = mergeHash;

    auto subject = history.getSubject(mergeHash);
    if (!subject) return failed(std::move(eval), "subject", subject.error());
    eval.merge.subject = subject.value();

    auto target = history.resolveParent(mergeHash, Constants::TARGET_PARENT);
    if (!target) return failed(std::move(eval), "first parent", target.error());
    auto incoming = history.resolveParent(mergeHash, Constants::INCOMING_PARENT);
    if (!incoming) return rejected(std::move(eval), MergeVerdict::NotAMerge);
    eval.merge.targetParent = target.value();
    eval.merge.incomingParent = incoming.value();

    const RevisionRange branch{eval.merge.targetParent, eval.merge.incomingParent};

    auto nested = history.hasAnyMerge(branch);
    if (!nested) return failed(std::move(eval), "nested merge check", nested.error());
    if (nested.value()) return rejected(std::move(eval), MergeVerdict::NestedMerge);

    if (isTagPull(eval.merge.subject)) return rejected(std::move(eval), MergeVerdict::TagPull);

    LogFilter touching;
    touching.path = path;
    auto relevant = history.listCommits(branch, touching);
    if (!relevant) return failed(std::move(eval), "path check", relevant.error());
    if (relevant.value().empty()) return rejected(std::move(eval), MergeVerdict::Irrelevant);

    auto body = history.getBody(mergeHash);
    if (!body) return failed(std::move(eval), "body", body.error());
    eval.merge.body = body.value();

    LogFilter all;
    all.oldestFirst = true;
    auto patches = history.listCommits(branch, all);
    if (!patches) return failed(std::move(eval), "patch list", patches.error());
    eval.patches = std::move(patches.value());

    eval.verdict = MergeVerdict::Included;
    return eval;
}

Expected<ReportStats> MergeReporter::run(const RevisionRange& range, const std::string& path) {
    auto& log = Logger::instance();
    log.info("Analyzing merge commits in " + range.toString() + " that affect " + path);

    auto merges = history.listMerges(range);
    if (!merges) {
        return Error{merges.error().code, "cannot enumerate merges in " + range.toString() + ": " + merges.error().message};
    }

    ReportStats stats;
    for (const auto& hash : merges.value()) {
        if (hash.empty()) continue;
        ++stats.scanned;

        MergeEvaluation eval = evaluate(hash, path);
        if (eval.verdict != MergeVerdict::Included) {
            std::string line = "skip " + hash + ": " + toString(eval.verdict);
            if (!eval.reason.empty()) line += " (" + eval.reason + ")";
            log.debug(line);
            continue;
        }

        log.info("Found (" + hash + ")  " + eval.merge.subject);
        ReportFormatter::writeMerge(out, eval.merge, eval.patches);
        ++stats.included;
    }
    out.flush();

    log.debug("scanned " + std::to_string(stats.scanned) + " merges, reported " + std::to_string(stats.included));
    return stats;
}

}
