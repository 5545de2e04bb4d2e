// poexam/driver/discovery.hpp - Find the PO files to check
#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace poexam::driver
{

/**
 * Result of file discovery.
 */
struct DiscoveryResult
{
  /// Files found, sorted and unique (only valid if success == true)
  std::vector<std::string> files;

  bool success = false;

  /// Error message if a root is missing or cannot be walked
  std::string error;

  static DiscoveryResult ok(std::vector<std::string> files)
  {
    DiscoveryResult r;
    r.files = std::move(files);
    r.success = true;
    return r;
  }

  static DiscoveryResult fail(std::string msg)
  {
    DiscoveryResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

/// Remove leading "./" components ("./po/fr.po" -> "po/fr.po").
[[nodiscard]] std::string normalize_path(std::string_view path);

/**
 * Expand roots into PO files.
 *
 * A file root is taken as is; a directory is walked recursively for `*.po`
 * files, skipping hidden files and directories. No roots means ".".
 */
[[nodiscard]] DiscoveryResult find_po_files(const std::vector<std::string> & roots);

}  // namespace poexam::driver
