#pragma once

#include <string>

namespace mergereport {

/**
 * @brief Commits reachable from `to` but not from `from`
 * 
 * Mirrors git's two-dot notation. Either end may be any revision
 * expression git accepts (hash, tag, branch, "v6.3^", ...).
 */
struct RevisionRange {
    std::string from;
    std::string to;

    /// Range that also contains `from` itself: "<from>^..<to>"
    static RevisionRange inclusive(const std::string& from, const std::string& to) {
        return RevisionRange{from + "^", to};
    }

    /// Git notation: "<from>..<to>"
    std::string toString() const { return from + ".." + to; }

    bool operator==(const RevisionRange& other) const { return from == other.from && to == other.to; }
};

}
