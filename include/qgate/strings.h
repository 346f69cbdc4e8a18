#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace qgate {

std::string Trim(std::string value);
std::string ToLower(std::string value);
bool StartsWith(std::string_view value, std::string_view prefix);
bool EndsWith(std::string_view value, std::string_view suffix);
bool Contains(std::string_view value, std::string_view needle);

// Splits on `delimiter`, trimming each piece and dropping empty ones.
std::vector<std::string> SplitList(const std::string &raw, char delimiter = ',');
std::vector<std::string> SplitLines(const std::string &content);
std::vector<std::string> SplitWhitespace(const std::string &line);

std::string FormatFixed(double value, int precision);

std::string ReadFile(const std::filesystem::path &path);
// Writes `<path>.tmp` and renames it over `path`.
void WriteFileAtomically(const std::filesystem::path &path,
                         const std::string &content);

// ISO-8601 with `Z` or `+hh:mm` offset; throws std::invalid_argument.
std::chrono::system_clock::time_point ParseIsoTimestamp(const std::string &value);
std::string FormatIsoTimestamp(std::chrono::system_clock::time_point value);

} // namespace qgate
