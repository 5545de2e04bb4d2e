// poexam/project/project_config.cpp - Project configuration implementation
//
#include "poexam/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

#include <utility>

#include "poexam/rules/selection.hpp"

namespace poexam
{

namespace
{

namespace fs = std::filesystem;

/// Parse a rule list: a YAML sequence or a comma separated string
std::optional<std::vector<std::string>> parse_rule_list(const YAML::Node & node)
{
  if (node.IsScalar()) {
    return rules::split_rule_list(node.as<std::string>());
  }
  if (!node.IsSequence()) {
    return std::nullopt;
  }
  std::vector<std::string> names;
  for (const auto & item : node) {
    names.push_back(item.as<std::string>());
  }
  return names;
}

fs::path resolve_path(const fs::path & root, const std::string & value)
{
  const fs::path path(value);
  return path.is_absolute() ? path : (root / path).lexically_normal();
}

/// Parse the 'check' section
std::optional<std::string> parse_check(const YAML::Node & node, CheckConfig & check)
{
  if (!node.IsMap()) {
    return "check must be a map";
  }
  if (node["select"]) {
    auto names = parse_rule_list(node["select"]);
    if (!names) {
      return "check.select must be a list";
    }
    check.select = std::move(*names);
  }
  if (node["ignore"]) {
    auto names = parse_rule_list(node["ignore"]);
    if (!names) {
      return "check.ignore must be a list";
    }
    check.ignore = std::move(*names);
  }
  if (node["severity"]) {
    if (!node["severity"].IsMap()) {
      return "check.severity must be a map";
    }
    for (const auto & item : node["severity"]) {
      const auto rule = item.first.as<std::string>();
      const auto value = item.second.as<std::string>();
      const auto severity = parse_severity(value);
      if (!severity) {
        return "invalid severity '" + value + "' for rule '" + rule +
               "' (must be 'info', 'warning' or 'error')";
      }
      check.severity[rule] = *severity;
    }
  }
  if (node["fuzzy"]) {
    check.fuzzy = node["fuzzy"].as<bool>();
  }
  if (node["noqa"]) {
    check.noqa = node["noqa"].as<bool>();
  }
  if (node["obsolete"]) {
    check.obsolete = node["obsolete"].as<bool>();
  }
  return std::nullopt;
}

/// Parse the 'spelling' section
std::optional<std::string> parse_spelling(
  const YAML::Node & node, const fs::path & root, SpellingConfig & spelling)
{
  if (!node.IsMap()) {
    return "spelling must be a map";
  }
  if (node["path_dicts"]) {
    spelling.path_dicts = resolve_path(root, node["path_dicts"].as<std::string>());
  }
  if (node["path_words"]) {
    spelling.path_words = resolve_path(root, node["path_words"].as<std::string>());
  }
  if (node["lang_id"]) {
    spelling.lang_id = node["lang_id"].as<std::string>();
  }
  return std::nullopt;
}

ConfigLoadResult parse_root(const YAML::Node & root, const fs::path & project_root)
{
  ProjectConfig config;
  config.project_root = project_root;

  if (!root || root.IsNull()) {
    return ConfigLoadResult::ok(std::move(config));
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("configuration must be a map");
  }

  // Parse 'check' section
  if (root["check"]) {
    if (auto error = parse_check(root["check"], config.check)) {
      return ConfigLoadResult::fail(std::move(*error));
    }
  }

  // Parse 'spelling' section
  if (root["spelling"]) {
    if (auto error = parse_spelling(root["spelling"], project_root, config.spelling)) {
      return ConfigLoadResult::fail(std::move(*error));
    }
  }

  if (root["jobs"]) {
    const int jobs = root["jobs"].as<int>();
    if (jobs < 1) {
      return ConfigLoadResult::fail("jobs must be a positive number");
    }
    config.jobs = static_cast<size_t>(jobs);
  }

  return ConfigLoadResult::ok(std::move(config));
}

}  // namespace

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  // Check if file exists
  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  try {
    const YAML::Node root = YAML::LoadFile(config_path.string());
    return parse_root(root, fs::absolute(config_path).parent_path());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
}

ConfigLoadResult parse_project_config(
  std::string_view content, const std::filesystem::path & project_root)
{
  try {
    const YAML::Node root = YAML::Load(std::string(content));
    return parse_root(root, project_root);
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
}

std::optional<std::filesystem::path> find_project_config(const std::filesystem::path & start_dir)
{
  fs::path current = fs::absolute(start_dir);

  // If start_dir is a file, start from its parent
  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_project_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    // Move up to parent
    const fs::path parent = current.parent_path();
    if (parent == current) {
      // Reached filesystem root
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace poexam
