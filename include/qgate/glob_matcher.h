#pragma once

#include <string>
#include <vector>

namespace qgate {

// The one pattern language used everywhere paths are filtered:
//   `**`     matches any number of path segments,
//   `*.ext`  matches a suffix,
//   `*`      inside a segment matches any run of characters in it,
//   anything else is a substring test.
// Paths are compared in generic (forward slash) form.
class GlobMatcher {
public:
  explicit GlobMatcher(std::string pattern);

  bool Matches(const std::string &path) const;
  const std::string &pattern() const { return pattern_; }

private:
  enum class Kind { kSegments, kSuffix, kWildcard, kSubstring };

  std::string pattern_;
  Kind kind_;
  std::vector<std::string> segments_;
};

bool MatchesAny(const std::vector<GlobMatcher> &matchers,
                const std::string &path);
std::vector<GlobMatcher> CompilePatterns(const std::vector<std::string> &patterns);

// Build output, dependency and minified trees that no analyzer looks at.
bool IsVendorPath(const std::string &relative_path);

class PathFilter {
public:
  PathFilter() = default;
  PathFilter(const std::vector<std::string> &include_patterns,
             const std::vector<std::string> &exclude_patterns);

  bool IsIncluded(const std::string &relative_path) const;
  bool ExplicitlyIncluded(const std::string &relative_path) const;
  bool HasIncludes() const { return !include_.empty(); }

private:
  std::vector<GlobMatcher> include_;
  std::vector<GlobMatcher> exclude_;
};

} // namespace qgate
