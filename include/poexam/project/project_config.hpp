// poexam/project/project_config.hpp - Project configuration (poexam.yaml)
//
// Parses and validates poexam.yaml files. Every value is optional: what is
// absent keeps the command-line default.
//
#pragma once

#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "poexam/basic/diagnostic.hpp"

namespace poexam
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * Check configuration section.
 */
struct CheckConfig
{
  /// Rules and groups to select (applied before the command line ones)
  std::vector<std::string> select;

  /// Rules and groups to ignore (applied before the command line ones)
  std::vector<std::string> ignore;

  /// Severity overrides by rule id
  std::map<std::string, Severity> severity;

  std::optional<bool> fuzzy;
  std::optional<bool> noqa;
  std::optional<bool> obsolete;
};

/**
 * Spelling configuration section.
 */
struct SpellingConfig
{
  /// Directory of hunspell dictionaries (absolute once loaded)
  std::optional<std::filesystem::path> path_dicts;

  /// Directory of extra word lists (absolute once loaded)
  std::optional<std::filesystem::path> path_words;

  /// Language of the sources
  std::optional<std::string> lang_id;
};

/**
 * Complete project configuration (poexam.yaml).
 */
struct ProjectConfig
{
  CheckConfig check;
  SpellingConfig spelling;

  /// Number of worker threads
  std::optional<size_t> jobs;

  /// Directory containing poexam.yaml (for resolving relative paths)
  std::filesystem::path project_root;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

/**
 * Result of loading a project configuration file.
 */
struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  ProjectConfig config;

  /// Whether loading succeeded
  bool success = false;

  /// Error message if loading failed
  std::string error;

  /// Create a successful result
  static ConfigLoadResult ok(ProjectConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  /// Create a failed result
  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load a project configuration from a poexam.yaml file.
 *
 * @param config_path Path to poexam.yaml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/**
 * Parse a project configuration from YAML text.
 *
 * @param content YAML document
 * @param project_root Directory relative paths are resolved against
 */
[[nodiscard]] ConfigLoadResult parse_project_config(
  std::string_view content, const std::filesystem::path & project_root);

/**
 * Find a project configuration file by searching upward from a directory.
 *
 * Searches for poexam.yaml starting from start_dir and moving up the
 * directory hierarchy until the filesystem root.
 *
 * @param start_dir Directory to start searching from
 * @return Path to poexam.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

/**
 * Default name of the project configuration file.
 */
inline constexpr const char * k_project_config_file_name = "poexam.yaml";

}  // namespace poexam
