#pragma once

#include <string>

namespace mergereport {

enum class LogLevel { Error = 0, Warn = 1, Info = 2, Debug = 3 };

/**
 * @brief Process-wide leveled logger
 *
 * Every level writes to stderr; stdout is reserved for report output.
 * Initial level comes from the MERGE_REPORT_LOG environment variable.
 */
class Logger {
public:
    static Logger& instance();
    void setLevel(LogLevel level);
    LogLevel level() const;
    void error(const std::string& msg) const;
    void warn(const std::string& msg) const;
    void info(const std::string& msg) const;
    void debug(const std::string& msg) const;

    /// Parse "error|warn|info|debug" or "0".."3"; unknown values map to Info
    static LogLevel parseLevel(const char* value);

private:
    Logger();
    LogLevel currentLevel;
};

}
