#include <qgate/escaping.h>

#include <gtest/gtest.h>

namespace {

TEST(EscapingTest, EscapesControlCharacters) {
  const std::string input = "src/a b.rs\t87.5\n\\";
  EXPECT_EQ("src/a b.rs\\t87.5\\n\\\\", qgate::Escape(input));
}

TEST(EscapingTest, SplitEscapedHandlesLiteralTabs) {
  const std::string line = "src/lib.rs\tweird\\tname\\nhere\t91.25";

  const auto fields = qgate::SplitEscaped(line);

  ASSERT_EQ(3u, fields.size());
  EXPECT_EQ("src/lib.rs", fields[0]);
  EXPECT_EQ("weird\tname\nhere", fields[1]);
  EXPECT_EQ("91.25", fields[2]);
}

TEST(EscapingTest, JoinedRecordStaysOnOneLine) {
  const std::vector<std::string> fields = {"src/odd\tname.rs", "50.0"};
  const auto line = qgate::JoinEscaped(fields);

  EXPECT_EQ(std::string::npos, line.find('\n'));
  EXPECT_EQ(fields, qgate::SplitEscaped(line));
}

TEST(EscapingTest, MarkdownCellsCannotBreakTables) {
  EXPECT_EQ("a\\|b<br>c", qgate::EscapeMarkdownCell("a|b\nc"));
}

} // namespace
