//
// Created by gregorian on 19/10/2026.
//

#ifndef INSIGHT_FILE_UTILS_H
#define INSIGHT_FILE_UTILS_H

#include <optional>
#include <string>
#include <string_view>

namespace insight::utils
{
    /**
     * Read the entire file at `path` as a string.
     *
     * @return The file contents, or std::nullopt if the file could not be opened.
     */
    std::optional<std::string> read_file(std::string_view path);

    /**
     * Write `content` to `path`, replacing any existing content. Missing parent
     * directories are created.
     *
     * @return True on success, false on failure.
     */
    bool write_file(std::string_view path, std::string_view content);

    /**
     * Write `content` to a sibling temporary file and rename it over `path`, so a
     * reader never observes a half-written file.
     */
    bool write_file_atomic(std::string_view path, std::string_view content);

    bool file_exists(std::string_view path);

    bool remove_file(std::string_view path);
}

#endif //INSIGHT_FILE_UTILS_H
