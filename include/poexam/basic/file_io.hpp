// poexam/basic/file_io.hpp - Whole-file reading
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <utility>

namespace poexam
{

/**
 * Result of reading a file.
 */
struct FileReadResult
{
  /// Raw bytes (only valid if success == true)
  std::string content;

  bool success = false;

  /// "could not open file" or "could not read file"
  std::string error;

  static FileReadResult ok(std::string content)
  {
    FileReadResult r;
    r.content = std::move(content);
    r.success = true;
    return r;
  }

  static FileReadResult fail(std::string msg)
  {
    FileReadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

/// Read a whole file in binary mode.
[[nodiscard]] FileReadResult read_file(const std::filesystem::path & path);

/**
 * Read a whole file in binary mode.
 *
 * @return std::nullopt if the file cannot be opened or read
 */
[[nodiscard]] std::optional<std::string> read_file_to_string(const std::filesystem::path & path);

}  // namespace poexam
