#pragma once

#include <qgate/source_discovery.h>

#include <string>
#include <vector>

namespace qgate {

// One physical line split into what the compiler sees and what it ignores.
// String literal contents are blanked out of `code` (quotes are kept) so
// keyword and marker searches never hit text inside literals.
struct ScannedLine {
  unsigned number = 0;
  std::string code;
  std::string comment;
  bool has_comment = false;

  bool IsBlank() const;
  bool IsCommentOnly() const;
};

enum class CommentSyntax { kCStyle, kHash };

CommentSyntax CommentSyntaxFor(Toolchain toolchain);

class SourceScanner {
public:
  explicit SourceScanner(Toolchain toolchain);

  std::vector<ScannedLine> Scan(const std::string &content) const;

private:
  Toolchain toolchain_;
};

// Non-blank lines that carry code (pure comment lines are not counted).
unsigned CountLogicalLines(const std::vector<ScannedLine> &lines);
unsigned CountLogicalLines(const std::string &content, Toolchain toolchain);

} // namespace qgate
