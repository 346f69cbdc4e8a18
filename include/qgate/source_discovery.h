#pragma once

#include <qgate/glob_matcher.h>
#include <qgate/logging.h>
#include <qgate/models.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace qgate {

enum class Toolchain { kRust, kDeno, kPythonUv, kGo };

std::string ToolchainName(Toolchain toolchain);
Toolchain ParseToolchain(const std::string &value);
Toolchain DetectToolchain(const std::filesystem::path &root);
const std::vector<std::string> &ToolchainExtensions(Toolchain toolchain);
std::optional<Toolchain> ToolchainForPath(const std::filesystem::path &path);

struct SourceSet {
  std::filesystem::path root;
  Toolchain toolchain = Toolchain::kRust;
  // Relative, generic-form, sorted and unique.
  std::vector<std::string> files;
};

struct DiscoveryOptions {
  std::optional<Toolchain> toolchain;
  std::vector<std::string> include_patterns;
  std::vector<std::string> exclude_patterns;
};

// Throws std::invalid_argument when `root` is not a directory.
std::filesystem::path ResolveProjectRoot(const std::filesystem::path &root);

class SourceDiscovery {
public:
  explicit SourceDiscovery(std::shared_ptr<Logger> logger = nullptr);

  SourceSet Discover(const std::filesystem::path &root,
                     const DiscoveryOptions &options) const;

private:
  std::shared_ptr<Logger> logger_;
};

std::string RelativePath(const std::filesystem::path &root,
                         const std::filesystem::path &path);

// One pattern per line; blank lines and `#` comments are skipped.
std::vector<std::string> LoadIgnoreFile(const std::filesystem::path &path);

// Test, bench and fixture trees excluded when no include pattern is given.
const std::vector<std::string> &DefaultExcludePatterns();

SelectionFilters
BuildSelectionFilters(std::vector<std::string> include_patterns,
                      std::vector<std::string> exclude_patterns,
                      const std::optional<std::filesystem::path> &ignore_file);

} // namespace qgate
