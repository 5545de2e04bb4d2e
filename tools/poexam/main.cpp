// poexam - PO catalog checker command line interface
//
// Usage:
//   poexam check [FILES...] [options]
//   poexam rules
//   poexam stats [FILES...] [options]
//
#include <fmt/format.h>
#include <fmt/ostream.h>

#include <chrono>
#include <filesystem>
#include <gsl/span>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "poexam/basic/diagnostic_printer.hpp"
#include "poexam/driver/pipeline.hpp"
#include "poexam/project/project_config.hpp"
#include "poexam/report/json_output.hpp"
#include "poexam/report/report.hpp"
#include "poexam/report/stats_printer.hpp"
#include "poexam/rules/registry.hpp"
#include "poexam/rules/selection.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "poexam v0.1.0 - check gettext catalogs\n\n"
            << "Usage: " << program_name << " <command> [options]\n\n"
            << "Commands:\n"
            << "  check [FILES...]         Check PO files (default: current directory)\n"
            << "  rules                    List the rules\n"
            << "  stats [FILES...]         Show translation statistics\n\n"
            << "Check options:\n"
            << "  --fuzzy                  Check fuzzy entries\n"
            << "  --noqa                   Check entries flagged noqa\n"
            << "  --obsolete               Check obsolete entries\n"
            << "  -s, --select <list>      Rules or groups to select (comma separated)\n"
            << "  -i, --ignore <list>      Rules or groups to ignore (comma separated)\n"
            << "  --path-dicts <dir>       Hunspell dictionaries (default: /usr/share/hunspell)\n"
            << "  --path-words <dir>       Extra words per language\n"
            << "  --lang-id <lang>         Language of the sources (default: en_US)\n"
            << "  -e, --severity <level>   Only rules with this severity (repeatable)\n"
            << "  -n, --no-errors          Do not display the diagnostics\n"
            << "  --sort <order>           line, message or rule (default: line)\n"
            << "  -r, --rule-stats         Display the number of problems by rule\n"
            << "  -f, --file-stats         Display the number of problems by file\n"
            << "  -o, --output <format>    human, json or misspelled (default: human)\n"
            << "  -q, --quiet              Display nothing, only set the exit status\n"
            << "  --show-settings          Display the settings used\n"
            << "  -j, --jobs <n>           Number of worker threads\n"
            << "  --encoding <name>        Charset of every file (default: from header)\n"
            << "  --config <path>          Configuration file (default: poexam.yaml)\n"
            << "  --no-config              Do not read any configuration file\n\n"
            << "Stats options:\n"
            << "  -o, --output <format>    human or json (default: human)\n"
            << "  -s, --sort <order>       path or status (default: path)\n"
            << "  -w, --words              Count words and characters\n\n"
            << "Options:\n"
            << "  -v, --verbose            Verbose output\n"
            << "  -h, --help               Show this help message\n";
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::vector<std::string> files;

  // check
  bool fuzzy = false;
  bool noqa = false;
  bool obsolete = false;
  std::vector<std::string> select;
  std::vector<std::string> ignore;
  std::optional<std::string> path_dicts;
  std::optional<std::string> path_words;
  std::optional<std::string> lang_id;
  std::vector<poexam::Severity> severities;
  bool no_errors = false;
  poexam::report::SortOrder sort = poexam::report::SortOrder::Line;
  bool rule_stats = false;
  bool file_stats = false;
  bool quiet = false;
  bool show_settings = false;
  std::optional<size_t> jobs;
  std::string encoding;
  std::optional<std::string> config_path;
  bool no_config = false;

  // stats
  poexam::report::StatsSort stats_sort = poexam::report::StatsSort::Path;
  bool words = false;

  std::string output = "human";
  bool verbose = false;
  bool show_help = false;

  /// Set when the command line is invalid
  std::string error;
};

bool parse_check_option(
  CommandArgs & args, const std::string & arg, const std::optional<std::string> & value,
  bool & used_value)
{
  using poexam::report::parse_sort_order;

  used_value = false;
  const auto take = [&]() -> std::optional<std::string> {
    if (!value) {
      args.error = fmt::format("missing value for option '{}'", arg);
      return std::nullopt;
    }
    used_value = true;
    return value;
  };

  if (arg == "--fuzzy") {
    args.fuzzy = true;
  } else if (arg == "--noqa") {
    args.noqa = true;
  } else if (arg == "--obsolete") {
    args.obsolete = true;
  } else if (arg == "-s" || arg == "--select") {
    if (auto v = take()) {
      for (auto & name : poexam::rules::split_rule_list(*v)) {
        args.select.push_back(std::move(name));
      }
    }
  } else if (arg == "-i" || arg == "--ignore") {
    if (auto v = take()) {
      for (auto & name : poexam::rules::split_rule_list(*v)) {
        args.ignore.push_back(std::move(name));
      }
    }
  } else if (arg == "--path-dicts") {
    args.path_dicts = take();
  } else if (arg == "--path-words") {
    args.path_words = take();
  } else if (arg == "--lang-id") {
    args.lang_id = take();
  } else if (arg == "-e" || arg == "--severity") {
    if (auto v = take()) {
      for (const auto & name : poexam::rules::split_rule_list(*v)) {
        const auto severity = poexam::parse_severity(name);
        if (!severity) {
          args.error = fmt::format("invalid severity '{}'", name);
          break;
        }
        args.severities.push_back(*severity);
      }
    }
  } else if (arg == "-n" || arg == "--no-errors") {
    args.no_errors = true;
  } else if (arg == "--sort") {
    if (auto v = take()) {
      const auto order = parse_sort_order(*v);
      if (!order) {
        args.error = fmt::format("invalid sort order '{}'", *v);
      } else {
        args.sort = *order;
      }
    }
  } else if (arg == "-r" || arg == "--rule-stats") {
    args.rule_stats = true;
  } else if (arg == "-f" || arg == "--file-stats") {
    args.file_stats = true;
  } else if (arg == "-q" || arg == "--quiet") {
    args.quiet = true;
  } else if (arg == "--show-settings") {
    args.show_settings = true;
  } else if (arg == "--encoding") {
    if (auto v = take()) {
      args.encoding = *v;
    }
  } else if (arg == "--config") {
    args.config_path = take();
  } else if (arg == "--no-config") {
    args.no_config = true;
  } else {
    return false;
  }
  return true;
}

bool parse_stats_option(
  CommandArgs & args, const std::string & arg, const std::optional<std::string> & value,
  bool & used_value)
{
  used_value = false;
  if (arg == "-s" || arg == "--sort") {
    if (!value) {
      args.error = fmt::format("missing value for option '{}'", arg);
    } else if (*value == "path") {
      args.stats_sort = poexam::report::StatsSort::Path;
    } else if (*value == "status") {
      args.stats_sort = poexam::report::StatsSort::Status;
    } else {
      args.error = fmt::format("invalid sort order '{}'", *value);
    }
    used_value = value.has_value();
  } else if (arg == "-w" || arg == "--words") {
    args.words = true;
  } else if (arg == "--encoding") {
    if (!value) {
      args.error = fmt::format("missing value for option '{}'", arg);
    } else {
      args.encoding = *value;
      used_value = true;
    }
  } else {
    return false;
  }
  return true;
}

CommandArgs parse_args(int argc, char * argv[])
{
  CommandArgs args;
  const gsl::span<char *> argv_span(argv, static_cast<size_t>(argc));

  if (argv_span.size() < 2) {
    args.show_help = true;
    return args;
  }

  args.command = argv_span[1];

  if (args.command == "-h" || args.command == "--help") {
    args.show_help = true;
    return args;
  }

  for (size_t i = 2; i < argv_span.size() && args.error.empty(); ++i) {
    const std::string arg = argv_span[i];
    const std::optional<std::string> value =
      i + 1 < argv_span.size() ? std::optional<std::string>(argv_span[i + 1]) : std::nullopt;
    bool used_value = false;

    if (arg == "-o" || arg == "--output") {
      if (!value) {
        args.error = fmt::format("missing value for option '{}'", arg);
      } else {
        args.output = *value;
        used_value = true;
      }
    } else if (arg == "-j" || arg == "--jobs") {
      if (!value) {
        args.error = fmt::format("missing value for option '{}'", arg);
        break;
      }
      used_value = true;
      try {
        const unsigned long jobs = std::stoul(*value);
        if (jobs == 0) {
          throw std::invalid_argument("zero");
        }
        args.jobs = static_cast<size_t>(jobs);
      } catch (const std::logic_error &) {
        args.error = fmt::format("invalid number of jobs '{}'", *value);
      }
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (
      (args.command == "check" && parse_check_option(args, arg, value, used_value)) ||
      (args.command == "stats" && parse_stats_option(args, arg, value, used_value)))
    {
      // handled
    } else if (!arg.empty() && arg[0] != '-') {
      args.files.push_back(arg);
    } else {
      args.error = fmt::format("unknown option '{}'", arg);
    }

    if (used_value) {
      ++i;
    }
  }

  return args;
}

bool use_color() { return isatty(fileno(stdout)) != 0; }

// ============================================================================
// Settings
// ============================================================================

/**
 * Settings of a check: command line merged over the configuration file.
 */
struct CheckSettings
{
  std::vector<poexam::rules::SelectionToken> tokens;
  poexam::rules::SelectionOptions selection;
  poexam::driver::ScanOptions scan;
};

/// Load the configuration file (if any) and merge the command line into it.
std::optional<CheckSettings> load_check_settings(const CommandArgs & args)
{
  poexam::ProjectConfig config;
  if (!args.no_config) {
    std::optional<fs::path> config_path;
    if (args.config_path) {
      config_path = fs::path(*args.config_path);
    } else {
      config_path = poexam::find_project_config(fs::current_path());
    }
    if (config_path) {
      auto loaded = poexam::load_project_config(*config_path);
      if (!loaded.success) {
        std::cerr << "error: " << config_path->string() << ": " << loaded.error << "\n";
        return std::nullopt;
      }
      if (args.verbose) {
        std::cerr << "info: using configuration file " << config_path->string() << "\n";
      }
      config = std::move(loaded.config);
    }
  }

  using poexam::rules::SelectionToken;
  CheckSettings settings;
  for (const auto & name : config.check.select) {
    settings.tokens.push_back(SelectionToken::select(name));
  }
  for (const auto & name : config.check.ignore) {
    settings.tokens.push_back(SelectionToken::exclude(name));
  }
  for (const auto & name : args.select) {
    settings.tokens.push_back(SelectionToken::select(name));
  }
  for (const auto & name : args.ignore) {
    settings.tokens.push_back(SelectionToken::exclude(name));
  }
  settings.selection.severity_overrides = config.check.severity;
  settings.selection.severity_filter = args.severities;

  auto & scan = settings.scan;
  scan.lint.fuzzy = args.fuzzy || config.check.fuzzy.value_or(false);
  scan.lint.noqa = args.noqa || config.check.noqa.value_or(false);
  scan.lint.obsolete = args.obsolete || config.check.obsolete.value_or(false);
  if (args.path_dicts) {
    scan.spelling.path_dicts = *args.path_dicts;
  } else if (config.spelling.path_dicts) {
    scan.spelling.path_dicts = *config.spelling.path_dicts;
  }
  if (args.path_words) {
    scan.spelling.path_words = fs::path(*args.path_words);
  } else {
    scan.spelling.path_words = config.spelling.path_words;
  }
  scan.spelling.lang_id = args.lang_id.value_or(config.spelling.lang_id.value_or("en_US"));
  scan.encoding = args.encoding;
  scan.jobs = args.jobs.value_or(config.jobs.value_or(0));
  return settings;
}

void print_settings(
  const CheckSettings & settings, const poexam::rules::RuleSet & rules, const CommandArgs & args)
{
  std::vector<std::string> names;
  for (const auto & enabled : rules) {
    names.emplace_back(enabled.rule->id());
  }
  std::cout << "Configuration:\n";
  fmt::print(
    std::cout, "  Rules enabled: {}\n", names.empty() ? "<none>" : fmt::format("{}", fmt::join(names, ", ")));
  fmt::print(
    std::cout, "  Check fuzzy entries: {}\n",
    settings.scan.lint.fuzzy || rules.contains("fuzzy") ? "yes" : "no");
  fmt::print(std::cout, "  Check noqa entries: {}\n", settings.scan.lint.noqa ? "yes" : "no");
  fmt::print(
    std::cout, "  Check obsolete entries: {}\n",
    settings.scan.lint.obsolete || rules.contains("obsolete") ? "yes" : "no");
  fmt::print(std::cout, "  Output format: {}\n", args.output);
}

// ============================================================================
// Commands
// ============================================================================

int cmd_check(const CommandArgs & args)
{
  if (args.output != "human" && args.output != "json" && args.output != "misspelled") {
    std::cerr << "error: invalid output format '" << args.output << "'\n";
    return 1;
  }

  const auto start = std::chrono::steady_clock::now();

  const auto settings = load_check_settings(args);
  if (!settings) {
    return 1;
  }

  const auto selected = poexam::rules::resolve_rules(
    poexam::rules::RuleRegistry::builtin(), settings->tokens, settings->selection);
  if (!selected.success) {
    std::cerr << "error: " << selected.error << "\n";
    return 1;
  }
  if (args.show_settings && !args.quiet) {
    print_settings(*settings, selected.rules, args);
  }

  const poexam::driver::Pipeline pipeline(settings->scan);
  auto scan = pipeline.check(args.files, selected.rules);
  if (!scan.success) {
    std::cerr << "error: " << scan.error << "\n";
    return 1;
  }
  for (const auto & warning : scan.warnings) {
    std::cerr << "warning: " << warning << "\n";
  }

  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
    std::chrono::steady_clock::now() - start);
  auto report = poexam::report::aggregate(std::move(scan.files), elapsed);

  if (args.verbose) {
    const size_t jobs = settings->scan.jobs == 0 ? poexam::driver::default_jobs() : settings->scan.jobs;
    fmt::print(
      std::cerr, "info: {} rules enabled, {} files checked with up to {} workers in {}ms\n",
      selected.rules.size(), report.files_checked, jobs, elapsed.count());
  }

  if (args.quiet) {
    return report.exit_code();
  }

  if (args.output == "json") {
    if (!args.no_errors) {
      std::cout << poexam::report::to_json(report.diagnostics).dump() << "\n";
    }
    return report.exit_code();
  }

  if (args.output == "misspelled") {
    if (!args.no_errors) {
      for (const auto & word : report.misspelled_words) {
        std::cout << word << "\n";
      }
    }
    return report.exit_code();
  }

  if (!args.no_errors) {
    poexam::report::sort_diagnostics(report.diagnostics, args.sort);
    poexam::DiagnosticPrinter printer(std::cout, use_color());
    printer.print_all(report.diagnostics);
  }
  if (args.rule_stats) {
    for (const auto & line : poexam::report::rule_stats_lines(report)) {
      std::cout << line << "\n";
    }
  }
  if (args.file_stats) {
    for (const auto & line : poexam::report::file_stats_lines(report)) {
      std::cout << line << "\n";
    }
  }
  std::cout << poexam::report::summary_line(report) << "\n";
  return report.exit_code();
}

int cmd_rules(const CommandArgs & /*args*/)
{
  const auto & registry = poexam::rules::RuleRegistry::builtin();

  const auto print_group = [&registry](bool default_enabled, std::string_view title) {
    std::vector<const poexam::rules::Rule *> rules;
    for (const auto & rule : registry.rules()) {
      if (rule.info.default_enabled == default_enabled) {
        rules.push_back(&rule);
      }
    }
    if (rules.empty()) {
      fmt::print(std::cout, "No {} rules.\n", title);
      return;
    }
    fmt::print(std::cout, "{} {} rules:\n", rules.size(), title);
    for (const auto * rule : rules) {
      fmt::print(
        std::cout, "  {} [{}]: {}\n", rule->id(), poexam::to_string(rule->info.default_severity),
        rule->info.description);
    }
  };

  print_group(true, "default");
  print_group(false, "other");
  fmt::print(std::cout, "Total: {} rules\n", registry.size());
  std::cout << "Special rules:\n"
            << "  all: select all rules\n"
            << "  checks: select rules that actually check (all rules except fuzzy, obsolete, "
               "unchanged and untranslated)\n"
            << "  spelling: select the spelling rules\n"
            << "  default: select the default rules\n";
  return 0;
}

int cmd_stats(const CommandArgs & args)
{
  if (args.output != "human" && args.output != "json") {
    std::cerr << "error: invalid output format '" << args.output << "'\n";
    return 1;
  }

  poexam::driver::ScanOptions options;
  options.words = args.words;
  options.encoding = args.encoding;
  options.jobs = args.jobs.value_or(0);

  const poexam::driver::Pipeline pipeline(options);
  auto scan = pipeline.stats(args.files);
  if (!scan.success) {
    std::cerr << "error: " << scan.error << "\n";
    return 1;
  }

  std::vector<poexam::report::FileStats> stats;
  for (auto & file : scan.files) {
    if (!file.stats) {
      for (const auto & diag : file.diagnostics) {
        std::cerr << "error: " << file.path << ": " << diag.message << "\n";
      }
      continue;
    }
    stats.push_back(std::move(*file.stats));
  }

  poexam::report::sort_stats(stats, args.stats_sort);
  if (stats.size() > 1) {
    stats.push_back(poexam::report::total_stats(stats));
  }

  poexam::report::StatsPrinter printer(std::cout, use_color());
  if (args.output == "json") {
    printer.print_json(stats);
  } else {
    printer.print_human(stats);
  }
  return 0;
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return 0;
  }

  if (!args.error.empty()) {
    std::cerr << "error: " << args.error << "\n";
    return 1;
  }

  if (args.command == "check") {
    return cmd_check(args);
  }
  if (args.command == "rules") {
    return cmd_rules(args);
  }
  if (args.command == "stats") {
    return cmd_stats(args);
  }

  std::cerr << "error: unknown command '" << args.command << "'\n";
  print_usage(argv[0]);
  return 1;
}
