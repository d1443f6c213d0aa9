#pragma once

/**
 * @brief Constants used throughout the codebase
 * 
 * Centralizes report markers, git format strings and environment variable
 * names so the text contract lives in one place.
 */
namespace mergereport {

namespace Constants {
    // Report layout
    constexpr const char* SEPARATOR_LINE =
        "=================================================================";
    constexpr const char* PATCH_INDENT = "  ";
    constexpr const char* DETAIL_INDENT = "    ";

    // Merges whose subject contains this are pulls of a tagged release
    constexpr const char* TAG_PULL_MARKER = "Merge tag";

    // Parent positions of a two-parent merge
    constexpr int TARGET_PARENT = 1;
    constexpr int INCOMING_PARENT = 2;

    // Environment
    constexpr const char* ENV_LOG_LEVEL = "MERGE_REPORT_LOG";
    constexpr const char* ENV_GIT_EXECUTABLE = "MERGE_REPORT_GIT";
    constexpr const char* DEFAULT_GIT_EXECUTABLE = "git";
    constexpr const char* GIT_DIR_NAME = ".git";
}
}
