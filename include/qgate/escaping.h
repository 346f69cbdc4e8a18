#pragma once

#include <string>
#include <vector>

namespace qgate {

// Tab-separated cache records: backslash, tab and newline are escaped so a
// record always occupies exactly one line.
std::string Escape(const std::string &value);
std::string Unescape(const std::string &value);
std::vector<std::string> SplitEscaped(const std::string &line);
std::string JoinEscaped(const std::vector<std::string> &fields);

// Markdown table cells cannot contain raw pipes or newlines.
std::string EscapeMarkdownCell(const std::string &value);

} // namespace qgate
