#include <qgate/cli_options.h>

#include <qgate/strings.h>

#include <algorithm>
#include <ostream>
#include <stdexcept>
#include <unordered_map>
#include <variant>

#include <yaml-cpp/yaml.h>

namespace qgate {
namespace {

using ConfigValue = std::variant<std::string, bool, std::vector<std::string>>;
using RawConfig = std::unordered_map<std::string, ConfigValue>;

bool ParseBool(const std::string &value) {
  const auto normalized = ToLower(Trim(value));
  return normalized == "true" || normalized == "1" || normalized == "yes" ||
         normalized == "on";
}

unsigned ParseCount(const std::string &value, const std::string &name) {
  const auto trimmed = Trim(value);
  if (trimmed.empty() ||
      !std::all_of(trimmed.begin(), trimmed.end(),
                   [](unsigned char c) { return c >= '0' && c <= '9'; })) {
    throw std::invalid_argument(name + " expects a non-negative integer, got '" +
                                value + "'");
  }
  try {
    return static_cast<unsigned>(std::stoul(trimmed));
  } catch (const std::out_of_range &) {
    throw std::invalid_argument(name + " is out of range: " + value);
  }
}

double ParseDecimal(const std::string &value, const std::string &name) {
  const auto trimmed = Trim(value);
  std::size_t consumed = 0;
  double parsed = 0.0;
  try {
    parsed = std::stod(trimmed, &consumed);
  } catch (const std::logic_error &) {
    consumed = 0;
  }
  if (trimmed.empty() || consumed != trimmed.size() || parsed < 0.0) {
    throw std::invalid_argument(name + " expects a non-negative number, got '" +
                                value + "'");
  }
  return parsed;
}

void AppendValues(const std::string &raw_values,
                  std::vector<std::string> &target) {
  for (auto &value : SplitList(raw_values)) {
    if (std::find(target.begin(), target.end(), value) == target.end()) {
      target.push_back(std::move(value));
    }
  }
}

bool IsFlag(const std::string &argument) { return StartsWith(argument, "-"); }

std::string RequireValue(const std::vector<std::string> &arguments,
                         std::size_t &index, const std::string &flag) {
  if (++index >= arguments.size()) {
    throw std::invalid_argument(flag + " requires a value");
  }
  return arguments[index];
}

// `--exclude a b --include c` style: one or more values up to the next flag.
void RequireValues(const std::vector<std::string> &arguments,
                   std::size_t &index, const std::string &flag,
                   std::vector<std::string> &target) {
  AppendValues(RequireValue(arguments, index, flag), target);
  while (index + 1 < arguments.size() && !IsFlag(arguments[index + 1])) {
    AppendValues(arguments[++index], target);
  }
}

template <typename Options>
bool HandleLoggingOption(const std::vector<std::string> &arguments,
                         std::size_t &index, Options &options) {
  const auto &argument = arguments[index];
  if (argument == "--log-level") {
    options.log_level = ParseLogLevel(RequireValue(arguments, index, argument));
    return true;
  }
  if (argument == "--verbose" || argument == "-v") {
    options.log_level = LogLevel::kInfo;
    return true;
  }
  if (argument == "--debug") {
    options.log_level = LogLevel::kDebug;
    return true;
  }
  return false;
}

// Flags both commands share.
template <typename Options>
bool HandleSelectionOption(const std::vector<std::string> &arguments,
                           std::size_t &index, Options &options) {
  const auto &argument = arguments[index];
  if (argument == "--project-path" || argument == "-p") {
    options.project_path = RequireValue(arguments, index, argument);
    return true;
  }
  if (argument == "--config") {
    options.config_file = RequireValue(arguments, index, argument);
    return true;
  }
  if (argument == "--cache-dir") {
    options.cache_directory = RequireValue(arguments, index, argument);
    return true;
  }
  if (argument == "--include") {
    RequireValues(arguments, index, argument, options.include);
    return true;
  }
  if (argument == "--exclude") {
    RequireValues(arguments, index, argument, options.exclude);
    return true;
  }
  if (argument == "--ignore-file") {
    options.ignore_file = RequireValue(arguments, index, argument);
    return true;
  }
  if (argument == "--toolchain") {
    options.toolchain = ToLower(RequireValue(arguments, index, argument));
    return true;
  }
  if (argument == "--parallelism" || argument == "--jobs") {
    options.parallelism =
        ParseCount(RequireValue(arguments, index, argument), argument);
    return true;
  }
  if (argument == "--coverage-min") {
    options.coverage_min =
        ParseDecimal(RequireValue(arguments, index, argument), argument);
    return true;
  }
  return HandleLoggingOption(arguments, index, options);
}

bool DispatchAnalyzeOption(const std::vector<std::string> &arguments,
                           std::size_t &index, AnalyzeOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--help" || argument == "-h") {
    options.show_help = true;
    return true;
  }
  if (argument == "--format" || argument == "-f") {
    options.format = ToLower(RequireValue(arguments, index, argument));
    return true;
  }
  if (argument == "--output" || argument == "-o") {
    options.output = RequireValue(arguments, index, argument);
    return true;
  }
  if (argument == "--top-files") {
    options.top_files =
        ParseCount(RequireValue(arguments, index, argument), argument);
    return true;
  }
  if (argument == "--threshold" || argument == "--max-cyclomatic") {
    options.threshold =
        ParseCount(RequireValue(arguments, index, argument), argument);
    return true;
  }
  if (argument == "--period-days" || argument == "--days") {
    options.period_days =
        ParseCount(RequireValue(arguments, index, argument), argument);
    return true;
  }
  if (argument == "--min-dead-lines") {
    options.min_dead_lines =
        ParseCount(RequireValue(arguments, index, argument), argument);
    return true;
  }
  if (argument == "--max-density") {
    options.max_density =
        ParseDecimal(RequireValue(arguments, index, argument), argument);
    return true;
  }
  if (argument == "--strict") {
    options.strict = true;
    return true;
  }
  if (argument == "--include-tests") {
    options.include_tests = true;
    return true;
  }
  return HandleSelectionOption(arguments, index, options);
}

bool HandleRefactorModeOption(const std::vector<std::string> &arguments,
                              std::size_t &index, RefactorOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--single-file-mode") {
    options.single_file_mode = true;
    return true;
  }
  if (argument == "--file") {
    options.file = RequireValue(arguments, index, argument);
    return true;
  }
  if (argument == "--test-file") {
    options.test_file = RequireValue(arguments, index, argument);
    return true;
  }
  if (argument == "--test-name") {
    options.test_name = RequireValue(arguments, index, argument);
    return true;
  }
  if (argument == "--github-issue-url") {
    options.github_issue_url = RequireValue(arguments, index, argument);
    return true;
  }
  if (argument == "--bug-report-path") {
    options.bug_report_path = RequireValue(arguments, index, argument);
    return true;
  }
  return false;
}

bool HandleQualityOption(const std::vector<std::string> &arguments,
                         std::size_t &index, RefactorOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--quality-profile") {
    options.quality_profile = ToLower(RequireValue(arguments, index, argument));
    return true;
  }
  if (argument == "--complexity-max") {
    options.complexity_max =
        ParseCount(RequireValue(arguments, index, argument), argument);
    return true;
  }
  if (argument == "--complexity-target") {
    options.complexity_target =
        ParseCount(RequireValue(arguments, index, argument), argument);
    return true;
  }
  if (argument == "--satd-allowed") {
    options.satd_allowed =
        ParseCount(RequireValue(arguments, index, argument), argument);
    return true;
  }
  return false;
}

bool DispatchRefactorOption(const std::vector<std::string> &arguments,
                            std::size_t &index, RefactorOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--help" || argument == "-h") {
    options.show_help = true;
    return true;
  }
  if (argument == "--max-iterations") {
    options.max_iterations =
        ParseCount(RequireValue(arguments, index, argument), argument);
    return true;
  }
  if (argument == "--dry-run") {
    options.dry_run = true;
    return true;
  }
  if (argument == "--ci-mode") {
    options.ci_mode = true;
    return true;
  }
  if (argument == "--no-resume") {
    options.resume = false;
    return true;
  }
  if (argument == "--rewrite-templates") {
    options.rewrite_templates = RequireValue(arguments, index, argument);
    return true;
  }
  return HandleRefactorModeOption(arguments, index, options) ||
         HandleQualityOption(arguments, index, options) ||
         HandleSelectionOption(arguments, index, options);
}

[[noreturn]] void ThrowUnknownKey(const std::string &key,
                                  const std::vector<std::string> &supported) {
  std::string message = "Unknown config key: " + key + ". Supported keys: ";
  for (std::size_t i = 0; i < supported.size(); ++i) {
    message += supported[i];
    if (i + 1 < supported.size()) {
      message += ", ";
    }
  }
  throw std::invalid_argument(message);
}

std::string ExtractStringScalar(const YAML::Node &node,
                                const std::string &key_name) {
  if (!node.IsScalar()) {
    throw std::invalid_argument("Config key '" + key_name +
                                "' must be a scalar value");
  }
  return node.as<std::string>();
}

std::string ExtractPathLike(const YAML::Node &node,
                            const std::string &key_name) {
  if (node.IsScalar()) {
    return node.as<std::string>();
  }
  if (node.IsMap()) {
    for (const auto &candidate : {"path", "dir", "directory"}) {
      if (node[candidate]) {
        return ExtractStringScalar(node[candidate], key_name);
      }
    }
    throw std::invalid_argument("Config key '" + key_name +
                                "' map must contain 'path', 'dir', or "
                                "'directory'");
  }
  throw std::invalid_argument("Config key '" + key_name +
                              "' must be a string or mapping");
}

std::vector<std::string> ExtractList(const YAML::Node &node,
                                     const std::string &key_name) {
  std::vector<std::string> values;
  if (node.IsSequence()) {
    for (const auto &child : node) {
      if (!child.IsScalar()) {
        throw std::invalid_argument("Config key '" + key_name +
                                    "' must be a list of strings");
      }
      AppendValues(child.as<std::string>(), values);
    }
    return values;
  }
  if (node.IsScalar()) {
    AppendValues(node.as<std::string>(), values);
    return values;
  }
  throw std::invalid_argument("Config key '" + key_name +
                              "' must be a string or list of strings");
}

bool ExtractBool(const YAML::Node &node, const std::string &key_name) {
  if (!node.IsScalar()) {
    throw std::invalid_argument("Config key '" + key_name +
                                "' must be a boolean or boolean-like string");
  }
  return ParseBool(node.as<std::string>());
}

bool IsListKey(const std::string &key) {
  return key == "include" || key == "exclude";
}

bool IsBoolKey(const std::string &key) {
  return key == "dry_run" || key == "ci_mode" || key == "resume" ||
         key == "strict" || key == "include_tests";
}

bool IsPathKey(const std::string &key) {
  return key == "project_path" || key == "cache_dir" || key == "ignore_file" ||
         key == "output" || key == "rewrite_templates";
}

ConfigValue ToConfigValue(const std::string &key, const YAML::Node &node) {
  if (IsListKey(key)) {
    return ExtractList(node, key);
  }
  if (IsBoolKey(key)) {
    return ConfigValue{ExtractBool(node, key)};
  }
  if (IsPathKey(key)) {
    return ConfigValue{ExtractPathLike(node, key)};
  }
  return ConfigValue{ExtractStringScalar(node, key)};
}

RawConfig ParseYamlConfig(const std::filesystem::path &path,
                          const std::vector<std::string> &supported) {
  if (!std::filesystem::exists(path)) {
    throw std::runtime_error("Config file not found: " + path.string());
  }
  const auto extension = ToLower(path.extension().string());
  if (extension != ".yml" && extension != ".yaml") {
    throw std::invalid_argument("Unsupported config format: " + extension);
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(path.string());
  } catch (const YAML::Exception &error) {
    throw std::invalid_argument("Invalid config file " + path.string() + ": " +
                                error.what());
  }
  if (root.IsNull()) {
    return {};
  }
  if (!root.IsMap()) {
    throw std::invalid_argument(
        "Config file must contain a mapping at the root");
  }

  RawConfig config;
  for (const auto &entry : root) {
    const auto raw_key = entry.first.as<std::string>();
    const auto key = NormalizeConfigKey(raw_key);
    if (std::find(supported.begin(), supported.end(), key) == supported.end()) {
      ThrowUnknownKey(raw_key, supported);
    }
    config[key] = ToConfigValue(key, entry.second);
  }
  return config;
}

const std::string &AsString(const ConfigValue &value) {
  return std::get<std::string>(value);
}

// Keys both option structs carry under the same name.
template <typename Options>
bool ApplySharedConfig(const std::string &key, const ConfigValue &value,
                       Options &options) {
  if (key == "project_path") {
    options.project_path = AsString(value);
  } else if (key == "cache_dir") {
    options.cache_directory = AsString(value);
  } else if (key == "ignore_file") {
    options.ignore_file = AsString(value);
  } else if (key == "include") {
    options.include = std::get<std::vector<std::string>>(value);
  } else if (key == "exclude") {
    options.exclude = std::get<std::vector<std::string>>(value);
  } else if (key == "toolchain") {
    options.toolchain = ToLower(AsString(value));
  } else if (key == "parallelism") {
    options.parallelism = ParseCount(AsString(value), key);
  } else if (key == "coverage_min") {
    options.coverage_min = ParseDecimal(AsString(value), key);
  } else if (key == "log_level") {
    options.log_level = ParseLogLevel(AsString(value));
  } else {
    return false;
  }
  return true;
}

void ApplyConfig(const RawConfig &config, AnalyzeOptions &options) {
  for (const auto &[key, value] : config) {
    if (ApplySharedConfig(key, value, options)) {
      continue;
    }
    if (key == "format") {
      options.format = ToLower(AsString(value));
    } else if (key == "output") {
      options.output = AsString(value);
    } else if (key == "top_files") {
      options.top_files = ParseCount(AsString(value), key);
    } else if (key == "threshold") {
      options.threshold = ParseCount(AsString(value), key);
    } else if (key == "period_days") {
      options.period_days = ParseCount(AsString(value), key);
    } else if (key == "min_dead_lines") {
      options.min_dead_lines = ParseCount(AsString(value), key);
    } else if (key == "max_density") {
      options.max_density = ParseDecimal(AsString(value), key);
    } else if (key == "strict") {
      options.strict = std::get<bool>(value);
    } else if (key == "include_tests") {
      options.include_tests = std::get<bool>(value);
    } else {
      ThrowUnknownKey(key, SupportedAnalyzeConfigKeys());
    }
  }
}

void ApplyConfig(const RawConfig &config, RefactorOptions &options) {
  for (const auto &[key, value] : config) {
    if (ApplySharedConfig(key, value, options)) {
      continue;
    }
    if (key == "max_iterations") {
      options.max_iterations = ParseCount(AsString(value), key);
    } else if (key == "dry_run") {
      options.dry_run = std::get<bool>(value);
    } else if (key == "ci_mode") {
      options.ci_mode = std::get<bool>(value);
    } else if (key == "resume") {
      options.resume = std::get<bool>(value);
    } else if (key == "complexity_max") {
      options.complexity_max = ParseCount(AsString(value), key);
    } else if (key == "complexity_target") {
      options.complexity_target = ParseCount(AsString(value), key);
    } else if (key == "satd_allowed") {
      options.satd_allowed = ParseCount(AsString(value), key);
    } else if (key == "quality_profile") {
      options.quality_profile = ToLower(AsString(value));
    } else if (key == "rewrite_templates") {
      options.rewrite_templates = AsString(value);
    } else {
      ThrowUnknownKey(key, SupportedRefactorConfigKeys());
    }
  }
}

template <typename T> void Override(T &target, const T &source) {
  if (source) {
    target = source;
  }
}

template <typename Options>
void MergeShared(Options &merged, const Options &cli_options) {
  Override(merged.project_path, cli_options.project_path);
  Override(merged.config_file, cli_options.config_file);
  Override(merged.cache_directory, cli_options.cache_directory);
  Override(merged.ignore_file, cli_options.ignore_file);
  Override(merged.toolchain, cli_options.toolchain);
  Override(merged.parallelism, cli_options.parallelism);
  Override(merged.coverage_min, cli_options.coverage_min);
  Override(merged.log_level, cli_options.log_level);
  if (!cli_options.include.empty()) {
    merged.include = cli_options.include;
  }
  if (!cli_options.exclude.empty()) {
    merged.exclude = cli_options.exclude;
  }
}

template <typename T>
void PutOptional(nlohmann::json &body, const char *key,
                 const std::optional<T> &value) {
  if (value) {
    body[key] = *value;
  }
}

void PutPath(nlohmann::json &body, const char *key,
             const std::optional<std::filesystem::path> &value) {
  if (value) {
    body[key] = value->string();
  }
}

template <typename Options>
nlohmann::json SharedBody(const Options &options) {
  nlohmann::json body = nlohmann::json::object();
  PutPath(body, "project_path", options.project_path);
  PutPath(body, "cache_dir", options.cache_directory);
  PutPath(body, "ignore_file", options.ignore_file);
  PutOptional(body, "toolchain", options.toolchain);
  PutOptional(body, "parallelism", options.parallelism);
  PutOptional(body, "coverage_min", options.coverage_min);
  if (!options.include.empty()) {
    body["include"] = options.include;
  }
  if (!options.exclude.empty()) {
    body["exclude"] = options.exclude;
  }
  return body;
}

} // namespace

AnalyzeOptions ParseAnalyzeArguments(const std::vector<std::string> &arguments) {
  AnalyzeOptions options;
  for (std::size_t i = 0; i < arguments.size(); ++i) {
    if (!DispatchAnalyzeOption(arguments, i, options)) {
      throw std::invalid_argument("Unknown argument: " + arguments[i]);
    }
    if (options.show_help) {
      break;
    }
  }
  return options;
}

RefactorOptions
ParseRefactorArguments(const std::vector<std::string> &arguments) {
  RefactorOptions options;
  for (std::size_t i = 0; i < arguments.size(); ++i) {
    if (!DispatchRefactorOption(arguments, i, options)) {
      throw std::invalid_argument("Unknown refactor argument: " + arguments[i]);
    }
    if (options.show_help) {
      break;
    }
  }
  return options;
}

CacheCleanOptions
ParseCacheCleanArguments(const std::vector<std::string> &arguments) {
  CacheCleanOptions options;
  for (std::size_t i = 0; i < arguments.size(); ++i) {
    const auto &arg = arguments[i];
    if (arg == "--project-path" || arg == "-p") {
      options.project_path = RequireValue(arguments, i, arg);
      continue;
    }
    if (arg == "--cache-dir") {
      options.cache_directory = RequireValue(arguments, i, arg);
      continue;
    }
    if (arg == "--help" || arg == "-h") {
      options.show_help = true;
      return options;
    }
    throw std::invalid_argument("Unknown cache argument: " + arg);
  }
  return options;
}

nlohmann::json ParseTemplateArguments(const std::vector<std::string> &arguments) {
  nlohmann::json flags = nlohmann::json::object();
  auto positional = nlohmann::json::array();
  for (std::size_t i = 0; i < arguments.size(); ++i) {
    const auto &argument = arguments[i];
    if (!StartsWith(argument, "--")) {
      positional.push_back(argument);
      continue;
    }
    auto key = argument.substr(2);
    std::optional<std::string> value;
    if (const auto equals = key.find('='); equals != std::string::npos) {
      value = key.substr(equals + 1);
      key.resize(equals);
    } else if (i + 1 < arguments.size() && !IsFlag(arguments[i + 1])) {
      value = arguments[++i];
    }
    key = NormalizeConfigKey(key);
    if (key.empty()) {
      throw std::invalid_argument("Malformed flag: " + argument);
    }
    if (value) {
      flags[key] = *value;
    } else {
      flags[key] = true;
    }
  }
  if (!positional.empty()) {
    flags["positional"] = std::move(positional);
  }
  return flags;
}

std::string NormalizeConfigKey(std::string key) {
  key = ToLower(Trim(key));
  std::replace(key.begin(), key.end(), '-', '_');
  static const std::unordered_map<std::string, std::string> aliases = {
      {"iterations", "max_iterations"},
      {"project", "project_path"},
      {"root", "project_path"},
      {"cache_directory", "cache_dir"},
      {"exclude_patterns", "exclude"},
      {"include_patterns", "include"},
      {"jobs", "parallelism"},
      {"profile", "quality_profile"},
      {"max_cyclomatic", "threshold"},
      {"days", "period_days"}};
  if (const auto alias = aliases.find(key); alias != aliases.end()) {
    return alias->second;
  }
  return key;
}

const std::vector<std::string> &SupportedAnalyzeConfigKeys() {
  static const std::vector<std::string> keys = {
      "project_path", "cache_dir",   "ignore_file",    "include",
      "exclude",      "toolchain",   "parallelism",    "coverage_min",
      "log_level",    "format",      "output",         "top_files",
      "threshold",    "period_days", "min_dead_lines", "max_density",
      "strict",       "include_tests"};
  return keys;
}

const std::vector<std::string> &SupportedRefactorConfigKeys() {
  static const std::vector<std::string> keys = {
      "project_path",   "cache_dir",         "ignore_file",
      "include",        "exclude",           "toolchain",
      "parallelism",    "coverage_min",      "log_level",
      "max_iterations", "dry_run",           "ci_mode",
      "resume",         "complexity_max",    "complexity_target",
      "satd_allowed",   "quality_profile",   "rewrite_templates"};
  return keys;
}

AnalyzeOptions ParseAnalyzeConfigFile(const std::filesystem::path &path) {
  AnalyzeOptions options;
  options.config_file = path;
  ApplyConfig(ParseYamlConfig(path, SupportedAnalyzeConfigKeys()), options);
  return options;
}

RefactorOptions ParseRefactorConfigFile(const std::filesystem::path &path) {
  RefactorOptions options;
  options.config_file = path;
  ApplyConfig(ParseYamlConfig(path, SupportedRefactorConfigKeys()), options);
  return options;
}

AnalyzeOptions MergeOptions(const AnalyzeOptions &config_options,
                            const AnalyzeOptions &cli_options) {
  AnalyzeOptions merged = config_options;
  MergeShared(merged, cli_options);
  Override(merged.output, cli_options.output);
  Override(merged.format, cli_options.format);
  Override(merged.top_files, cli_options.top_files);
  Override(merged.threshold, cli_options.threshold);
  Override(merged.period_days, cli_options.period_days);
  Override(merged.min_dead_lines, cli_options.min_dead_lines);
  Override(merged.max_density, cli_options.max_density);
  Override(merged.strict, cli_options.strict);
  Override(merged.include_tests, cli_options.include_tests);
  return merged;
}

RefactorOptions MergeOptions(const RefactorOptions &config_options,
                             const RefactorOptions &cli_options) {
  RefactorOptions merged = config_options;
  MergeShared(merged, cli_options);
  Override(merged.file, cli_options.file);
  Override(merged.test_file, cli_options.test_file);
  Override(merged.test_name, cli_options.test_name);
  Override(merged.github_issue_url, cli_options.github_issue_url);
  Override(merged.bug_report_path, cli_options.bug_report_path);
  Override(merged.rewrite_templates, cli_options.rewrite_templates);
  Override(merged.quality_profile, cli_options.quality_profile);
  Override(merged.max_iterations, cli_options.max_iterations);
  Override(merged.complexity_max, cli_options.complexity_max);
  Override(merged.complexity_target, cli_options.complexity_target);
  Override(merged.satd_allowed, cli_options.satd_allowed);
  Override(merged.dry_run, cli_options.dry_run);
  Override(merged.ci_mode, cli_options.ci_mode);
  Override(merged.resume, cli_options.resume);
  Override(merged.single_file_mode, cli_options.single_file_mode);
  return merged;
}

AnalyzeOptions ResolveAnalyzeOptions(const AnalyzeOptions &cli_options) {
  if (cli_options.show_help || !cli_options.config_file) {
    return cli_options;
  }
  return MergeOptions(ParseAnalyzeConfigFile(*cli_options.config_file),
                      cli_options);
}

RefactorOptions ResolveRefactorOptions(const RefactorOptions &cli_options) {
  if (cli_options.show_help) {
    return cli_options;
  }
  RefactorOptions merged = cli_options;
  if (cli_options.config_file) {
    merged = MergeOptions(ParseRefactorConfigFile(*cli_options.config_file),
                          cli_options);
  }
  if (merged.single_file_mode.value_or(false) && !merged.file) {
    throw std::invalid_argument("--file is required in single-file mode");
  }
  return merged;
}

nlohmann::json ToRequestBody(const AnalyzeOptions &options) {
  auto body = SharedBody(options);
  PutOptional(body, "format", options.format);
  PutOptional(body, "top_files", options.top_files);
  PutOptional(body, "threshold", options.threshold);
  PutOptional(body, "period_days", options.period_days);
  PutOptional(body, "min_dead_lines", options.min_dead_lines);
  PutOptional(body, "max_density", options.max_density);
  PutOptional(body, "strict", options.strict);
  PutOptional(body, "include_tests", options.include_tests);
  return body;
}

nlohmann::json ToRequestBody(const RefactorOptions &options) {
  auto body = SharedBody(options);
  PutPath(body, "file", options.file);
  PutPath(body, "test_file", options.test_file);
  PutPath(body, "bug_report_path", options.bug_report_path);
  PutPath(body, "rewrite_templates", options.rewrite_templates);
  PutOptional(body, "test_name", options.test_name);
  PutOptional(body, "github_issue_url", options.github_issue_url);
  PutOptional(body, "quality_profile", options.quality_profile);
  PutOptional(body, "max_iterations", options.max_iterations);
  PutOptional(body, "complexity_max", options.complexity_max);
  PutOptional(body, "complexity_target", options.complexity_target);
  PutOptional(body, "satd_allowed", options.satd_allowed);
  PutOptional(body, "dry_run", options.dry_run);
  PutOptional(body, "ci_mode", options.ci_mode);
  PutOptional(body, "resume", options.resume);
  PutOptional(body, "single_file_mode", options.single_file_mode);
  return body;
}

LoggingConfig BuildLoggingConfig(const std::optional<LogLevel> &level) {
  LoggingConfig logging;
  logging.level = level.value_or(LogLevel::kWarn);
  return logging;
}

bool IsUnimplementedAnalysis(const std::string &name) {
  static const std::vector<std::string> names = {
      "dag",           "makefile",          "provability",
      "duplicates",    "graph-metrics",     "name-similarity",
      "proof-annotations", "incremental-coverage", "symbol-table",
      "big-o"};
  return std::find(names.begin(), names.end(), name) != names.end();
}

void PrintAnalyzeUsage(std::ostream &stream) {
  stream
      << "Usage: qgate analyze <analysis> [options]\n"
      << "Analyses: complexity, churn, dead-code, satd, deep-context, tdg,\n"
      << "          lint-hotspot, coverage, defect-prediction, comprehensive\n"
      << "Options:\n"
      << "  --project-path <path>  Project root (default: .)\n"
      << "  --format <name>        summary, full, json, sarif, markdown or\n"
      << "                         enforcement-json (default: summary)\n"
      << "  --output <path>        Write the report to a file\n"
      << "  --toolchain <name>     rust, deno, python-uv or go (default: "
         "detected)\n"
      << "  --include <glob...>    Only analyze matching files\n"
      << "  --exclude <glob...>    Skip matching files\n"
      << "  --ignore-file <path>   File of exclude patterns, one per line\n"
      << "  --cache-dir <path>     Cache directory (default: "
         "<project>/.qgate_cache)\n"
      << "  --top-files <n>        Number of files to list (default: 10)\n"
      << "  --threshold <n>        Cyclomatic complexity threshold (default: "
         "10)\n"
      << "  --period-days <n>      Churn window in days (default: 30)\n"
      << "  --strict               SATD: only explicit debt markers\n"
      << "  --include-tests        Dead code: analyze test files too\n"
      << "  --min-dead-lines <n>   Dead code: minimum dead lines per file\n"
      << "  --coverage-min <pct>   Coverage: minimum line coverage "
         "(default: 80)\n"
      << "  --max-density <value>  Lint hotspot: target defect density "
         "(default: 0.05)\n"
      << "  --parallelism <n>      Worker threads for file analysis\n"
      << "  --config <file>        YAML config file\n"
      << "  --log-level <level>    Logging verbosity (error,warn,info,debug)\n"
      << "  --verbose              Shortcut for --log-level info\n"
      << "  --debug                Shortcut for --log-level debug\n"
      << "  --help                 Show this message\n";
}

void PrintRefactorUsage(std::ostream &stream) {
  stream
      << "Usage: qgate refactor auto [options]\n"
      << "Options:\n"
      << "  --project-path <path>      Project root (default: .)\n"
      << "  --max-iterations <n>       Iteration budget (default: 10)\n"
      << "  --cache-dir <path>         State directory (default: "
         "<project>/.qgate_cache)\n"
      << "  --dry-run                  Print plans without changing files\n"
      << "  --ci-mode                  Exit 1 unless every gate passes\n"
      << "  --no-resume                Ignore saved refactor state\n"
      << "  --single-file-mode         Only refactor --file\n"
      << "  --file <path>              Target file\n"
      << "  --test-file <path>         Refactor a test and its dependencies\n"
      << "  --test-name <name>         Test function within --test-file\n"
      << "  --github-issue-url <url>   Refactor files named by a GitHub issue\n"
      << "  --bug-report-path <path>   Refactor files named by a bug report\n"
      << "  --include <glob...>        Only consider matching files\n"
      << "  --exclude <glob...>        Skip matching files\n"
      << "  --ignore-file <path>       File of exclude patterns\n"
      << "  --toolchain <name>         rust, deno, python-uv or go\n"
      << "  --quality-profile <name>   Quality profile (supported: extreme)\n"
      << "  --coverage-min <pct>       Minimum coverage gate\n"
      << "  --complexity-max <n>       Maximum cyclomatic complexity gate\n"
      << "  --complexity-target <n>    Complexity to aim for when rewriting\n"
      << "  --satd-allowed <n>         Allowed debt markers\n"
      << "  --rewrite-templates <file> YAML built-in rewrite templates\n"
      << "  --parallelism <n>          Worker threads for measurement\n"
      << "  --config <file>            YAML config file\n"
      << "  --log-level <level>        Logging verbosity "
         "(error,warn,info,debug)\n"
      << "  --verbose                  Shortcut for --log-level info\n"
      << "  --debug                    Shortcut for --log-level debug\n"
      << "  --help                     Show this message\n";
}

} // namespace qgate
