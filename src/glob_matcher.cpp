#include <qgate/glob_matcher.h>

#include <qgate/strings.h>

#include <algorithm>
#include <stdexcept>

namespace qgate {
namespace {

std::vector<std::string> SplitSegments(const std::string &path) {
  std::vector<std::string> segments;
  std::string current;
  for (const auto character : path) {
    if (character == '/' || character == '\\') {
      if (!current.empty() && current != ".") {
        segments.push_back(current);
      }
      current.clear();
      continue;
    }
    current.push_back(character);
  }
  if (!current.empty() && current != ".") {
    segments.push_back(current);
  }
  return segments;
}

// `*` and `?` wildcards within a single segment.
bool MatchSegment(const std::string &pattern, const std::string &text) {
  std::size_t p = 0;
  std::size_t t = 0;
  std::size_t star = std::string::npos;
  std::size_t resume = 0;
  while (t < text.size()) {
    if (p < pattern.size() && (pattern[p] == '?' || pattern[p] == text[t])) {
      ++p;
      ++t;
    } else if (p < pattern.size() && pattern[p] == '*') {
      star = p++;
      resume = t;
    } else if (star != std::string::npos) {
      p = star + 1;
      t = ++resume;
    } else {
      return false;
    }
  }
  while (p < pattern.size() && pattern[p] == '*') {
    ++p;
  }
  return p == pattern.size();
}

bool MatchSegments(const std::vector<std::string> &pattern, std::size_t p,
                   const std::vector<std::string> &path, std::size_t s) {
  if (p == pattern.size()) {
    return s == path.size();
  }
  if (pattern[p] == "**") {
    for (std::size_t skip = s; skip <= path.size(); ++skip) {
      if (MatchSegments(pattern, p + 1, path, skip)) {
        return true;
      }
    }
    return false;
  }
  if (s == path.size() || !MatchSegment(pattern[p], path[s])) {
    return false;
  }
  return MatchSegments(pattern, p + 1, path, s + 1);
}

std::string Normalize(std::string path) {
  std::replace(path.begin(), path.end(), '\\', '/');
  while (StartsWith(path, "./")) {
    path.erase(0, 2);
  }
  return path;
}

} // namespace

GlobMatcher::GlobMatcher(std::string pattern)
    : pattern_(Normalize(Trim(std::move(pattern)))) {
  if (pattern_.empty()) {
    throw std::invalid_argument("Glob pattern must not be empty");
  }
  if (Contains(pattern_, "**")) {
    kind_ = Kind::kSegments;
    segments_ = SplitSegments(pattern_);
  } else if (StartsWith(pattern_, "*.") && !Contains(pattern_, "/") &&
             pattern_.find('*', 1) == std::string::npos) {
    kind_ = Kind::kSuffix;
  } else if (Contains(pattern_, "*") || Contains(pattern_, "?")) {
    kind_ = Kind::kWildcard;
    segments_ = SplitSegments(pattern_);
  } else {
    kind_ = Kind::kSubstring;
  }
}

bool GlobMatcher::Matches(const std::string &path) const {
  const auto normalized = Normalize(path);
  switch (kind_) {
  case Kind::kSegments:
    return MatchSegments(segments_, 0, SplitSegments(normalized), 0);
  case Kind::kSuffix:
    return EndsWith(normalized, pattern_.substr(1));
  case Kind::kWildcard: {
    const auto path_segments = SplitSegments(normalized);
    if (segments_.size() == 1 && !path_segments.empty()) {
      return MatchSegment(segments_.front(), path_segments.back());
    }
    return MatchSegments(segments_, 0, path_segments, 0);
  }
  case Kind::kSubstring:
    return Contains(normalized, pattern_);
  }
  return false;
}

bool MatchesAny(const std::vector<GlobMatcher> &matchers,
                const std::string &path) {
  return std::any_of(matchers.begin(), matchers.end(),
                     [&](const auto &matcher) { return matcher.Matches(path); });
}

std::vector<GlobMatcher>
CompilePatterns(const std::vector<std::string> &patterns) {
  std::vector<GlobMatcher> matchers;
  matchers.reserve(patterns.size());
  for (const auto &pattern : patterns) {
    matchers.emplace_back(pattern);
  }
  return matchers;
}

bool IsVendorPath(const std::string &relative_path) {
  static const std::vector<std::string> kVendorDirectories = {
      "/target/", "/node_modules/", "/.git/", "/vendor/", "/dist/", "/build/"};
  static const std::vector<GlobMatcher> kVendorFiles = {
      GlobMatcher("**/*.min.*"), GlobMatcher("**/*.wasm")};

  const auto anchored = "/" + Normalize(relative_path);
  for (const auto &directory : kVendorDirectories) {
    if (Contains(anchored, directory)) {
      return true;
    }
  }
  return MatchesAny(kVendorFiles, relative_path);
}

PathFilter::PathFilter(const std::vector<std::string> &include_patterns,
                       const std::vector<std::string> &exclude_patterns)
    : include_(CompilePatterns(include_patterns)),
      exclude_(CompilePatterns(exclude_patterns)) {}

bool PathFilter::IsIncluded(const std::string &relative_path) const {
  if (MatchesAny(exclude_, relative_path)) {
    return false;
  }
  if (!include_.empty() && !MatchesAny(include_, relative_path)) {
    return false;
  }
  if (IsVendorPath(relative_path) && !ExplicitlyIncluded(relative_path)) {
    return false;
  }
  return true;
}

bool PathFilter::ExplicitlyIncluded(const std::string &relative_path) const {
  return MatchesAny(include_, relative_path);
}

} // namespace qgate
