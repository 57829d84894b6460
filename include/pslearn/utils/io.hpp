#pragma once

#include "pslearn/core/data.hpp"

namespace pslearn::utils {

    /**
     * Current local time as "[YYYY-MM-DD | HH:MM:SS]", the prefix of every progress line.
     */
    std::string SystemDatetime();

    /**
     * Prints a timestamped line to stdout when verbosity >= level.
     * Safe to call from inside the parallel evaluation region.
     */
    void LogMessage(int verbosity, int level, const std::string& message);

    /**
     * Prints a timestamped line to stderr regardless of verbosity.
     */
    void LogError(const std::string& message);

    /**
     * Reads a CSV file: header row with column names, numeric cells, target in the last column.
     * Throws ConfigurationError on unreadable files or malformed rows.
     */
    core::TDataset ReadDataset(const std::string& path);

    /**
     * Outputs the result of a search to the screen.
     */
    void WriteResultScreen(const std::string& mode, const std::string& dataPath,
                           const core::TSearchResult& result, double totalTime);

    /**
     * Appends the result as one tab-separated line to a results file.
     */
    void WriteResults(const std::string& path, const std::string& mode, const std::string& dataPath,
                      const core::TSearchResult& result, double totalTime);

} // namespace pslearn::utils
