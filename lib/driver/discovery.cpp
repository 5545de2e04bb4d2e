// poexam/driver/discovery.cpp - Find the PO files to check
#include "poexam/driver/discovery.hpp"

#include <fmt/core.h>

#include <filesystem>
#include <set>
#include <system_error>

namespace fs = std::filesystem;

namespace poexam::driver
{

namespace
{

bool is_hidden(const fs::path & path)
{
  const std::string name = path.filename().string();
  return name.size() > 1 && name.front() == '.' && name != "..";
}

}  // namespace

std::string normalize_path(std::string_view path)
{
  while (path.size() > 2 && path.substr(0, 2) == "./") {
    path.remove_prefix(2);
    while (!path.empty() && path.front() == '/') {
      path.remove_prefix(1);
    }
  }
  return std::string(path);
}

DiscoveryResult find_po_files(const std::vector<std::string> & roots)
{
  const std::vector<std::string> all_roots = roots.empty() ? std::vector<std::string>{"."} : roots;
  std::set<std::string> files;

  for (const auto & root : all_roots) {
    std::error_code ec;
    const fs::file_status status = fs::status(root, ec);
    if (ec || !fs::exists(status)) {
      return DiscoveryResult::fail(fmt::format("path not found: {}", root));
    }
    if (!fs::is_directory(status)) {
      files.insert(normalize_path(root));
      continue;
    }

    try {
      // Unreadable subdirectories are skipped, an unreadable root still fails
      fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied);
      const fs::recursive_directory_iterator end;
      for (; it != end; ++it) {
        const fs::path & path = it->path();
        if (is_hidden(path)) {
          if (it->is_directory()) {
            it.disable_recursion_pending();
          }
          continue;
        }
        if (it->is_regular_file() && path.extension() == ".po") {
          files.insert(normalize_path(path.generic_string()));
        }
      }
    } catch (const fs::filesystem_error & e) {
      return DiscoveryResult::fail(fmt::format("could not read directory {}: {}", root, e.what()));
    }
  }

  return DiscoveryResult::ok(std::vector<std::string>(files.begin(), files.end()));
}

}  // namespace poexam::driver
