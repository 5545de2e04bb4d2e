// poexam/basic/file_io.cpp - Whole-file reading
#include "poexam/basic/file_io.hpp"

#include <fstream>
#include <sstream>
#include <system_error>

namespace poexam
{

FileReadResult read_file(const std::filesystem::path & path)
{
  std::ifstream f(path, std::ios::in | std::ios::binary);
  if (!f.is_open()) {
    return FileReadResult::fail("could not open file");
  }
  std::error_code ec;
  if (std::filesystem::is_directory(path, ec)) {
    return FileReadResult::fail("could not read file");
  }
  std::ostringstream ss;
  ss << f.rdbuf();
  if (f.bad()) {
    return FileReadResult::fail("could not read file");
  }
  return FileReadResult::ok(ss.str());
}

std::optional<std::string> read_file_to_string(const std::filesystem::path & path)
{
  FileReadResult result = read_file(path);
  if (!result.success) {
    return std::nullopt;
  }
  return std::move(result.content);
}

}  // namespace poexam
