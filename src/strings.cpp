#include <qgate/strings.h>

#include <algorithm>
#include <cctype>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace qgate {

std::string Trim(std::string value) {
  const auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
  value.erase(value.begin(),
              std::find_if(value.begin(), value.end(),
                           [&](unsigned char ch) { return !is_space(ch); }));
  value.erase(std::find_if(value.rbegin(), value.rend(),
                           [&](unsigned char ch) { return !is_space(ch); })
                  .base(),
              value.end());
  return value;
}

std::string ToLower(std::string value) {
  std::transform(
      value.begin(), value.end(), value.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

bool StartsWith(std::string_view value, std::string_view prefix) {
  return value.size() >= prefix.size() &&
         value.compare(0, prefix.size(), prefix) == 0;
}

bool EndsWith(std::string_view value, std::string_view suffix) {
  return value.size() >= suffix.size() &&
         value.compare(value.size() - suffix.size(), suffix.size(), suffix) ==
             0;
}

bool Contains(std::string_view value, std::string_view needle) {
  return value.find(needle) != std::string_view::npos;
}

std::vector<std::string> SplitList(const std::string &raw, char delimiter) {
  std::vector<std::string> values;
  std::string current;
  const auto flush = [&]() {
    auto trimmed = Trim(current);
    if (!trimmed.empty()) {
      values.push_back(std::move(trimmed));
    }
    current.clear();
  };
  for (const auto character : raw) {
    if (character == delimiter) {
      flush();
    } else {
      current.push_back(character);
    }
  }
  flush();
  return values;
}

std::vector<std::string> SplitLines(const std::string &content) {
  std::vector<std::string> lines;
  std::string current;
  for (const auto character : content) {
    if (character == '\n') {
      if (!current.empty() && current.back() == '\r') {
        current.pop_back();
      }
      lines.push_back(std::move(current));
      current.clear();
      continue;
    }
    current.push_back(character);
  }
  if (!current.empty()) {
    lines.push_back(std::move(current));
  }
  return lines;
}

std::vector<std::string> SplitWhitespace(const std::string &line) {
  std::istringstream stream(line);
  std::vector<std::string> tokens;
  std::string token;
  while (stream >> token) {
    tokens.push_back(token);
  }
  return tokens;
}

std::string FormatFixed(double value, int precision) {
  std::ostringstream stream;
  stream << std::fixed << std::setprecision(precision) << value;
  return stream.str();
}

std::string ReadFile(const std::filesystem::path &path) {
  std::ifstream stream(path, std::ios::binary);
  if (!stream) {
    throw std::runtime_error("Failed to open file: " + path.string());
  }
  return std::string(std::istreambuf_iterator<char>(stream),
                     std::istreambuf_iterator<char>());
}

void WriteFileAtomically(const std::filesystem::path &path,
                         const std::string &content) {
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path());
  }
  auto temporary = path;
  temporary += ".tmp";
  {
    std::ofstream stream(temporary, std::ios::binary | std::ios::trunc);
    if (!stream) {
      throw std::runtime_error("Failed to open output file: " +
                               temporary.string());
    }
    stream << content;
    stream.flush();
    if (!stream) {
      throw std::runtime_error("Failed to write output file: " +
                               temporary.string());
    }
  }
  std::error_code error;
  std::filesystem::rename(temporary, path, error);
  if (error) {
    std::filesystem::remove(temporary);
    throw std::runtime_error("Failed to replace " + path.string() + ": " +
                             error.message());
  }
}

std::chrono::system_clock::time_point
ParseIsoTimestamp(const std::string &value) {
  std::tm parts{};
  std::istringstream stream(value);
  stream >> std::get_time(&parts, "%Y-%m-%dT%H:%M:%S");
  if (stream.fail()) {
    throw std::invalid_argument("Invalid timestamp: " + value);
  }
  auto seconds = static_cast<long long>(timegm(&parts));
  std::string rest;
  std::getline(stream, rest);
  if (!rest.empty() && rest.front() == '.') {
    const auto zone = rest.find_first_of("Z+-");
    rest = zone == std::string::npos ? std::string() : rest.substr(zone);
  }
  if (!rest.empty() && (rest.front() == '+' || rest.front() == '-')) {
    if (rest.size() < 6 || rest[3] != ':') {
      throw std::invalid_argument("Invalid timezone offset: " + value);
    }
    const int sign = rest.front() == '-' ? -1 : 1;
    const auto offset = std::stoi(rest.substr(1, 2)) * 3600 +
                        std::stoi(rest.substr(4, 2)) * 60;
    seconds -= sign * offset;
  }
  return std::chrono::system_clock::time_point(std::chrono::seconds(seconds));
}

std::string FormatIsoTimestamp(std::chrono::system_clock::time_point value) {
  const auto time = std::chrono::system_clock::to_time_t(value);
  std::tm parts{};
  gmtime_r(&time, &parts);
  std::ostringstream stream;
  stream << std::put_time(&parts, "%Y-%m-%dT%H:%M:%SZ");
  return stream.str();
}

} // namespace qgate
