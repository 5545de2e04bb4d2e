// poexam/report/json_output.hpp - JSON serialization of diagnostics and statistics
#pragma once

#include <nlohmann/json.hpp>
#include <vector>

#include "poexam/basic/diagnostic.hpp"
#include "poexam/report/statistics.hpp"

namespace poexam::report
{

/**
 * Serialize one diagnostic.
 *
 *   {"path", "rule", "severity", "message",
 *    "lines": [{"line_number", "message", "highlights": [[start, end], ...]}]}
 *
 * Highlights are character offsets (not bytes) into the line message.
 */
[[nodiscard]] nlohmann::json to_json(const Diagnostic & diag);

/// Array of diagnostics.
[[nodiscard]] nlohmann::json to_json(const std::vector<Diagnostic> & diagnostics);

/**
 * Serialize the statistics of one file.
 *
 *   {"path", "entries": {...}, "words": {...}, "chars": {...}}
 *
 * "words" and "chars" are only present when computed.
 */
[[nodiscard]] nlohmann::json to_json(const FileStats & stats);

[[nodiscard]] nlohmann::json to_json(const std::vector<FileStats> & stats);

}  // namespace poexam::report
