#include "core/ReportFormatter.hpp"

#include <sstream>
#include <string>

#include "core/Constants.hpp"

namespace mergereport {

void ReportFormatter::writeMerge(std::ostream& out, const MergeCommit& merge, const std::vector<CommitSummary>& patches) {
    out << Constants::SEPARATOR_LINE << "\n";
    out << "MERGE: " << merge.subject << "\n";
    out << "HASH: " << merge.hash << "\n";
    out << "\n";

    // git terminates the %b output with its own newline, then a blank line follows
    out << "COVER LETTER / MERGE MESSAGE:\n";
    out << merge.body << "\n";
    out << "\n";

    out << "PATCHES:\n";
    for (const auto& patch : patches) {
        out << Constants::PATCH_INDENT << patch.shortHash << " " << patch.subject << "\n";
    }
    out << "\n";
}

void ReportFormatter::writeCommit(std::ostream& out, const CommitDetails& commit) {
    out << "commit " << commit.hash << "\n";
    out << "Author: " << commit.authorName << " <" << commit.authorEmail << ">\n";
    out << "Date:   " << commit.date << "\n";
    if (!commit.files.empty()) {
        out << "Files:\n";
        for (const auto& file : commit.files) {
            out << Constants::DETAIL_INDENT << file << "\n";
        }
    }
    out << "\n";

    std::istringstream iss(commit.message);
    std::string line;
    while (std::getline(iss, line)) {
        if (line.empty()) {
            out << "\n";
        } else {
            out << Constants::DETAIL_INDENT << line << "\n";
        }
    }
    out << "\n";
}

}
