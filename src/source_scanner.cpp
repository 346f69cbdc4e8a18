#include <qgate/source_scanner.h>

#include <qgate/strings.h>

#include <cctype>

namespace qgate {
namespace {

enum class Mode { kCode, kBlockComment, kString };

struct ScanState {
  Mode mode = Mode::kCode;
  // Closing delimiter of the open string literal.
  std::string terminator;
  bool escapes = true;
  unsigned block_depth = 0;
};

bool IsIdentifierChar(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

// Rust raw strings: r"..", r#".."#, br#".."#.
bool TryOpenRawString(const std::string &line, std::size_t index,
                      ScanState &state, std::size_t &consumed) {
  std::size_t cursor = index;
  if (line[cursor] == 'b' && cursor + 1 < line.size() &&
      line[cursor + 1] == 'r') {
    ++cursor;
  }
  if (line[cursor] != 'r') {
    return false;
  }
  if (index > 0 && IsIdentifierChar(line[index - 1])) {
    return false;
  }
  ++cursor;
  std::size_t hashes = 0;
  while (cursor < line.size() && line[cursor] == '#') {
    ++hashes;
    ++cursor;
  }
  if (cursor >= line.size() || line[cursor] != '"') {
    return false;
  }
  state.mode = Mode::kString;
  state.terminator = "\"" + std::string(hashes, '#');
  state.escapes = false;
  consumed = cursor - index + 1;
  return true;
}

// Distinguishes 'a' and '\n' from lifetimes such as 'a or 'static.
bool IsRustCharLiteral(const std::string &line, std::size_t index) {
  if (index + 2 < line.size() && line[index + 1] == '\\') {
    return true;
  }
  return index + 2 < line.size() && line[index + 2] == '\'';
}

} // namespace

bool ScannedLine::IsBlank() const {
  return Trim(code).empty() && Trim(comment).empty() && !has_comment;
}

bool ScannedLine::IsCommentOnly() const {
  return Trim(code).empty() && has_comment;
}

CommentSyntax CommentSyntaxFor(Toolchain toolchain) {
  return toolchain == Toolchain::kPythonUv ? CommentSyntax::kHash
                                           : CommentSyntax::kCStyle;
}

SourceScanner::SourceScanner(Toolchain toolchain) : toolchain_(toolchain) {}

std::vector<ScannedLine>
SourceScanner::Scan(const std::string &content) const {
  const auto syntax = CommentSyntaxFor(toolchain_);
  const auto raw_lines = SplitLines(content);
  std::vector<ScannedLine> result;
  result.reserve(raw_lines.size());
  ScanState state;

  for (std::size_t line_index = 0; line_index < raw_lines.size();
       ++line_index) {
    const auto &line = raw_lines[line_index];
    ScannedLine scanned;
    scanned.number = static_cast<unsigned>(line_index + 1);

    std::size_t i = 0;
    while (i < line.size()) {
      const char c = line[i];
      if (state.mode == Mode::kBlockComment) {
        scanned.has_comment = true;
        if (line.compare(i, 2, "*/") == 0) {
          if (--state.block_depth == 0) {
            state.mode = Mode::kCode;
          }
          i += 2;
          continue;
        }
        if (toolchain_ == Toolchain::kRust && line.compare(i, 2, "/*") == 0) {
          ++state.block_depth;
          scanned.comment += "/*";
          i += 2;
          continue;
        }
        scanned.comment.push_back(c);
        ++i;
        continue;
      }

      if (state.mode == Mode::kString) {
        if (state.escapes && c == '\\') {
          scanned.code += "  ";
          i += 2;
          continue;
        }
        if (line.compare(i, state.terminator.size(), state.terminator) == 0) {
          scanned.code += state.terminator;
          i += state.terminator.size();
          state.mode = Mode::kCode;
          continue;
        }
        scanned.code.push_back(' ');
        ++i;
        continue;
      }

      // Code mode.
      if (syntax == CommentSyntax::kCStyle) {
        if (line.compare(i, 2, "//") == 0) {
          scanned.has_comment = true;
          scanned.comment += line.substr(i + 2);
          break;
        }
        if (line.compare(i, 2, "/*") == 0) {
          scanned.has_comment = true;
          state.mode = Mode::kBlockComment;
          state.block_depth = 1;
          i += 2;
          continue;
        }
      } else if (c == '#') {
        scanned.has_comment = true;
        scanned.comment += line.substr(i + 1);
        break;
      }

      std::size_t consumed = 0;
      if (toolchain_ == Toolchain::kRust &&
          (c == 'r' || c == 'b') &&
          TryOpenRawString(line, i, state, consumed)) {
        scanned.code += line.substr(i, consumed);
        i += consumed;
        continue;
      }

      if (toolchain_ == Toolchain::kPythonUv &&
          (line.compare(i, 3, "\"\"\"") == 0 ||
           line.compare(i, 3, "'''") == 0)) {
        state.mode = Mode::kString;
        state.terminator = line.substr(i, 3);
        state.escapes = true;
        scanned.code += state.terminator;
        i += 3;
        continue;
      }

      if (c == '"' || (c == '`' && toolchain_ != Toolchain::kRust) ||
          (c == '\'' && (toolchain_ != Toolchain::kRust ||
                         IsRustCharLiteral(line, i)))) {
        state.mode = Mode::kString;
        state.terminator = std::string(1, c);
        // Go raw strings use backticks without escapes.
        state.escapes = !(c == '`' && toolchain_ == Toolchain::kGo);
        scanned.code.push_back(c);
        ++i;
        continue;
      }

      scanned.code.push_back(c);
      ++i;
    }

    // Single-quoted and double-quoted literals never span lines except in
    // JS templates, Go raw strings, Python triple quotes and Rust strings.
    if (state.mode == Mode::kString && state.terminator.size() == 1 &&
        state.terminator != "`" && toolchain_ != Toolchain::kRust) {
      state.mode = Mode::kCode;
    }
    result.push_back(std::move(scanned));
  }
  return result;
}

unsigned CountLogicalLines(const std::vector<ScannedLine> &lines) {
  unsigned count = 0;
  for (const auto &line : lines) {
    if (!Trim(line.code).empty()) {
      ++count;
    }
  }
  return count;
}

unsigned CountLogicalLines(const std::string &content, Toolchain toolchain) {
  return CountLogicalLines(SourceScanner(toolchain).Scan(content));
}

} // namespace qgate
