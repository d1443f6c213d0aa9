#include "core/Repository.hpp"

#include "core/Constants.hpp"

namespace fs = std::filesystem;

namespace mergereport {

bool Repository::isRepositoryRoot(const fs::path& dir) {
    std::error_code ec;
    fs::path gd = dir / Constants::GIT_DIR_NAME;
    if (!fs::exists(gd, ec)) return false;
    return fs::is_directory(gd, ec) || fs::is_regular_file(gd, ec);
}

Expected<fs::path> Repository::discoverRoot(const fs::path& start) {
    std::error_code ec;
    fs::path cur = fs::absolute(start, ec);
    if (ec) {
        return Error{ErrorCode::NotARepository, "Cannot resolve " + start.string() + ": " + ec.message()};
    }
    cur = cur.lexically_normal();
    if (!fs::is_directory(cur, ec)) {
        return Error{ErrorCode::NotARepository, "Not a directory: " + cur.string()};
    }
    while (true) {
        if (isRepositoryRoot(cur)) {
            return cur;
        }
        if (!cur.has_parent_path() || cur == cur.parent_path()) {
            return Error{ErrorCode::NotARepository, "Not inside a git repository: " + start.string()};
        }
        cur = cur.parent_path();
    }
}

}
