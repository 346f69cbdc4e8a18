#include <qgate/source_discovery.h>

#include <qgate/strings.h>

#include <algorithm>
#include <fstream>
#include <stdexcept>

namespace qgate {
namespace {

bool HasExtension(const std::filesystem::path &path,
                  const std::vector<std::string> &extensions) {
  const auto extension = path.extension().string();
  if (extension.empty()) {
    return false;
  }
  return std::find(extensions.begin(), extensions.end(),
                   extension.substr(1)) != extensions.end();
}

bool IsSkippedDirectory(const std::filesystem::path &path) {
  const auto name = path.filename().string();
  return name == ".git" || name == "target" || name == "node_modules" ||
         name == "vendor" || name == "dist" || name == "build" ||
         name == ".qgate_cache";
}

} // namespace

std::string ToolchainName(Toolchain toolchain) {
  switch (toolchain) {
  case Toolchain::kRust:
    return "rust";
  case Toolchain::kDeno:
    return "deno";
  case Toolchain::kPythonUv:
    return "python-uv";
  case Toolchain::kGo:
    return "go";
  }
  return "rust";
}

Toolchain ParseToolchain(const std::string &value) {
  const auto normalized = ToLower(Trim(value));
  if (normalized == "rust") {
    return Toolchain::kRust;
  }
  if (normalized == "deno" || normalized == "typescript" ||
      normalized == "ts" || normalized == "javascript") {
    return Toolchain::kDeno;
  }
  if (normalized == "python-uv" || normalized == "python") {
    return Toolchain::kPythonUv;
  }
  if (normalized == "go") {
    return Toolchain::kGo;
  }
  throw std::invalid_argument("Unsupported toolchain: " + value);
}

Toolchain DetectToolchain(const std::filesystem::path &root) {
  if (std::filesystem::exists(root / "Cargo.toml")) {
    return Toolchain::kRust;
  }
  if (std::filesystem::exists(root / "deno.json") ||
      std::filesystem::exists(root / "deno.jsonc") ||
      std::filesystem::exists(root / "package.json")) {
    return Toolchain::kDeno;
  }
  if (std::filesystem::exists(root / "pyproject.toml") ||
      std::filesystem::exists(root / "setup.py")) {
    return Toolchain::kPythonUv;
  }
  if (std::filesystem::exists(root / "go.mod")) {
    return Toolchain::kGo;
  }
  return Toolchain::kRust;
}

const std::vector<std::string> &ToolchainExtensions(Toolchain toolchain) {
  static const std::vector<std::string> kRust = {"rs"};
  static const std::vector<std::string> kDeno = {"ts", "tsx", "js", "jsx"};
  static const std::vector<std::string> kPython = {"py"};
  static const std::vector<std::string> kGo = {"go"};
  switch (toolchain) {
  case Toolchain::kRust:
    return kRust;
  case Toolchain::kDeno:
    return kDeno;
  case Toolchain::kPythonUv:
    return kPython;
  case Toolchain::kGo:
    return kGo;
  }
  return kRust;
}

std::optional<Toolchain> ToolchainForPath(const std::filesystem::path &path) {
  for (const auto toolchain : {Toolchain::kRust, Toolchain::kDeno,
                               Toolchain::kPythonUv, Toolchain::kGo}) {
    if (HasExtension(path, ToolchainExtensions(toolchain))) {
      return toolchain;
    }
  }
  return std::nullopt;
}

std::filesystem::path ResolveProjectRoot(const std::filesystem::path &root) {
  if (root.empty()) {
    throw std::invalid_argument("Project path must not be empty");
  }
  const auto normalized = std::filesystem::weakly_canonical(root);
  if (!std::filesystem::is_directory(normalized)) {
    throw std::invalid_argument("Project path is not a directory: " +
                                normalized.string());
  }
  return normalized;
}

std::string RelativePath(const std::filesystem::path &root,
                         const std::filesystem::path &path) {
  if (!path.is_absolute()) {
    return path.lexically_normal().generic_string();
  }
  return path.lexically_relative(root).generic_string();
}

SourceDiscovery::SourceDiscovery(std::shared_ptr<Logger> logger)
    : logger_(EnsureLogger(std::move(logger))) {}

SourceSet SourceDiscovery::Discover(const std::filesystem::path &root,
                                    const DiscoveryOptions &options) const {
  SourceSet result;
  result.root = ResolveProjectRoot(root);
  result.toolchain = options.toolchain.value_or(DetectToolchain(result.root));
  const auto &extensions = ToolchainExtensions(result.toolchain);
  const PathFilter filter(options.include_patterns, options.exclude_patterns);

  std::filesystem::recursive_directory_iterator it(
      result.root, std::filesystem::directory_options::skip_permission_denied);
  for (const std::filesystem::recursive_directory_iterator end; it != end;
       ++it) {
    const auto &entry = *it;
    const auto relative = RelativePath(result.root, entry.path());
    if (entry.is_directory()) {
      if (IsSkippedDirectory(entry.path()) &&
          !filter.ExplicitlyIncluded(relative + "/")) {
        it.disable_recursion_pending();
      }
      continue;
    }
    if (!entry.is_regular_file() || !HasExtension(entry.path(), extensions)) {
      continue;
    }
    if (!filter.IsIncluded(relative)) {
      continue;
    }
    result.files.push_back(relative);
  }

  std::sort(result.files.begin(), result.files.end());
  result.files.erase(std::unique(result.files.begin(), result.files.end()),
                     result.files.end());

  logger_->Log(LogLevel::kInfo, "discovery.complete",
               {{"root", result.root.string()},
                {"toolchain", ToolchainName(result.toolchain)},
                {"count", std::to_string(result.files.size())}});
  return result;
}

std::vector<std::string> LoadIgnoreFile(const std::filesystem::path &path) {
  std::ifstream stream(path);
  if (!stream) {
    throw std::invalid_argument("Ignore file not found: " + path.string());
  }
  std::vector<std::string> patterns;
  std::string line;
  while (std::getline(stream, line)) {
    line = Trim(line);
    if (line.empty() || line.front() == '#') {
      continue;
    }
    patterns.push_back(line);
  }
  return patterns;
}

const std::vector<std::string> &DefaultExcludePatterns() {
  static const std::vector<std::string> patterns = {
      "tests/**", "benches/**", "**/test_*.rs", "**/*_test.rs",
      "**/fixtures/**"};
  return patterns;
}

SelectionFilters
BuildSelectionFilters(std::vector<std::string> include_patterns,
                      std::vector<std::string> exclude_patterns,
                      const std::optional<std::filesystem::path> &ignore_file) {
  SelectionFilters filters;
  if (ignore_file) {
    const auto loaded = LoadIgnoreFile(*ignore_file);
    exclude_patterns.insert(exclude_patterns.end(), loaded.begin(),
                            loaded.end());
  }
  if (include_patterns.empty()) {
    const auto &defaults = DefaultExcludePatterns();
    exclude_patterns.insert(exclude_patterns.end(), defaults.begin(),
                            defaults.end());
  }
  // Validates every pattern once, up front.
  CompilePatterns(include_patterns);
  CompilePatterns(exclude_patterns);
  filters.include_patterns = std::move(include_patterns);
  filters.exclude_patterns = std::move(exclude_patterns);
  return filters;
}

} // namespace qgate
