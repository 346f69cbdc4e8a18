#include <qgate/escaping.h>

namespace qgate {

std::string Escape(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size());
  for (const auto character : value) {
    switch (character) {
    case '\\':
      escaped.append("\\\\");
      break;
    case '\t':
      escaped.append("\\t");
      break;
    case '\n':
      escaped.append("\\n");
      break;
    default:
      escaped.push_back(character);
    }
  }
  return escaped;
}

std::string Unescape(const std::string &value) {
  std::string unescaped;
  unescaped.reserve(value.size());
  for (std::size_t i = 0; i < value.size(); ++i) {
    if (value[i] != '\\' || i + 1 >= value.size()) {
      unescaped.push_back(value[i]);
      continue;
    }
    const auto next = value[++i];
    if (next == 't') {
      unescaped.push_back('\t');
    } else if (next == 'n') {
      unescaped.push_back('\n');
    } else {
      unescaped.push_back(next);
    }
  }
  return unescaped;
}

std::vector<std::string> SplitEscaped(const std::string &line) {
  std::vector<std::string> fields;
  std::string current;
  for (const auto character : line) {
    if (character == '\t') {
      fields.push_back(Unescape(current));
      current.clear();
      continue;
    }
    current.push_back(character);
  }
  fields.push_back(Unescape(current));
  return fields;
}

std::string JoinEscaped(const std::vector<std::string> &fields) {
  std::string line;
  for (std::size_t i = 0; i < fields.size(); ++i) {
    if (i > 0) {
      line.push_back('\t');
    }
    line.append(Escape(fields[i]));
  }
  return line;
}

std::string EscapeMarkdownCell(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size());
  for (const auto character : value) {
    if (character == '|') {
      escaped.append("\\|");
    } else if (character == '\n') {
      escaped.append("<br>");
    } else if (character != '\r') {
      escaped.push_back(character);
    }
  }
  return escaped;
}

} // namespace qgate
