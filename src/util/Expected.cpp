#include "util/Expected.hpp"

namespace mergereport {

const char* toString(ErrorCode code) {
    switch (code) {
        case ErrorCode::None: return "none";
        case ErrorCode::InvalidArgs: return "invalid arguments";
        case ErrorCode::NotARepository: return "not a repository";
        case ErrorCode::RevisionNotFound: return "revision not found";
        case ErrorCode::CommandFailed: return "command failed";
        case ErrorCode::ProcessError: return "process error";
        case ErrorCode::ParseError: return "parse error";
        case ErrorCode::InternalError: return "internal error";
    }
    return "unknown";
}

}
