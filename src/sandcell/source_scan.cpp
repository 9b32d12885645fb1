#include <sandcell/source_scan.h>

#include <cctype>
#include <string_view>

#include <fmt/format.h>
#include <sandcell/notebook.h>

namespace {

struct LogicalLine {
  size_t begin, end; // [begin, end) in the source, without trailing blanks
  size_t indent;
  std::vector<size_t> semicolons; // statement separators outside brackets
};

[[noreturn]] void ParseError(const std::string& code, size_t pos, const std::string& what) {
  size_t line = 1;
  for (size_t i = 0; i < pos && i < code.size(); i++) line += code[i] == '\n';
  throw NotebookError(NotebookErrorKind::PARSE_ERROR, fmt::format("line {}: {}", line, what));
}

// returns the position after the closing quote
size_t SkipString(const std::string& code, size_t pos) {
  char quote = code[pos];
  bool triple = code.compare(pos, 3, std::string(3, quote)) == 0;
  size_t i = pos + (triple ? 3 : 1);
  while (i < code.size()) {
    char c = code[i];
    if (c == '\\') {
      i += 2;
      continue;
    }
    if (triple) {
      if (code.compare(i, 3, std::string(3, quote)) == 0) return i + 3;
    } else {
      if (c == quote) return i + 1;
      if (c == '\n') break;
    }
    i++;
  }
  ParseError(code, pos, "unterminated string literal");
}

std::vector<LogicalLine> SplitLogicalLines(const std::string& code) {
  std::vector<LogicalLine> ret;
  std::vector<std::pair<char, size_t>> brackets;
  size_t i = 0, n = code.size();
  while (i < n) {
    size_t line_begin = i, indent = 0;
    while (i < n && (code[i] == ' ' || code[i] == '\t' || code[i] == '\f')) {
      indent = code[i] == '\t' ? (indent / 8 + 1) * 8 : indent + 1;
      i++;
    }
    if (i >= n) break;
    if (code[i] == '\n' || code[i] == '\r') {
      i++;
      continue;
    }
    if (code[i] == '#') {
      while (i < n && code[i] != '\n') i++;
      continue;
    }
    LogicalLine line{line_begin, i, indent, {}};
    while (i < n) {
      char c = code[i];
      if (c == '#') {
        while (i < n && code[i] != '\n') i++;
        continue;
      }
      if (c == '\\' && i + 1 < n && (code[i + 1] == '\n' || code[i + 1] == '\r')) {
        i += code.compare(i + 1, 2, "\r\n") == 0 ? 3 : 2;
        continue;
      }
      if (c == '\'' || c == '"') {
        i = line.end = SkipString(code, i);
        continue;
      }
      if (c == '\n' && brackets.empty()) {
        i++;
        break;
      }
      if (c == '(' || c == '[' || c == '{') {
        brackets.emplace_back(c, i);
      } else if (c == ')' || c == ']' || c == '}') {
        char open = c == ')' ? '(' : c == ']' ? '[' : '{';
        if (brackets.empty() || brackets.back().first != open) {
          ParseError(code, i, fmt::format("unmatched '{}'", c));
        }
        brackets.pop_back();
      } else if (c == ';' && brackets.empty()) {
        line.semicolons.push_back(i);
      }
      if (!isspace((unsigned char)c)) line.end = i + 1;
      i++;
    }
    ret.push_back(std::move(line));
  }
  if (!brackets.empty()) {
    ParseError(code, brackets.back().second, fmt::format("'{}' was never closed", brackets.back().first));
  }
  return ret;
}

std::string_view Trim(std::string_view str) {
  while (!str.empty() && isspace((unsigned char)str.front())) str.remove_prefix(1);
  while (!str.empty() && isspace((unsigned char)str.back())) str.remove_suffix(1);
  return str;
}

// leading keyword/identifier, or "@" for a decorator
std::string_view FirstWord(std::string_view str) {
  str = Trim(str);
  if (!str.empty() && str[0] == '@') return str.substr(0, 1);
  size_t len = 0;
  while (len < str.size() && (isalnum((unsigned char)str[len]) || str[len] == '_')) len++;
  return str.substr(0, len);
}

std::string_view SecondWord(std::string_view str) {
  str = Trim(str);
  return FirstWord(str.substr(FirstWord(str).size()));
}

bool IsDefinitionHeader(std::string_view str) {
  std::string_view word = FirstWord(str);
  return word == "def" || word == "class" || (word == "async" && SecondWord(str) == "def");
}

} // namespace

SourceScan ScanSource(const std::string& code) {
  std::vector<LogicalLine> lines = SplitLogicalLines(code);
  auto Text = [&](const LogicalLine& line) {
    return std::string_view(code).substr(line.begin, line.end - line.begin);
  };
  SourceScan ret;
  for (size_t i = 0; i < lines.size();) {
    // bodies of compound statements are never top-level
    if (lines[i].indent > 0) {
      i++;
      continue;
    }
    std::string_view word = FirstWord(Text(lines[i]));
    if (word == "@" || IsDefinitionHeader(Text(lines[i]))) {
      size_t header = i;
      while (header < lines.size() && lines[header].indent == 0 &&
             FirstWord(Text(lines[header])) == "@") {
        header++;
      }
      if (header == lines.size() || lines[header].indent > 0 || !IsDefinitionHeader(Text(lines[header]))) {
        i = header;
        continue;
      }
      size_t last = header;
      while (last + 1 < lines.size() && lines[last + 1].indent > 0) last++;
      ret.definitions.emplace_back(Trim(std::string_view(code).substr(
          lines[i].begin, lines[last].end - lines[i].begin)));
      i = last + 1;
      continue;
    }
    size_t begin = lines[i].begin;
    auto AddStatement = [&](size_t end) {
      std::string_view stmt = Trim(std::string_view(code).substr(begin, end - begin));
      std::string_view first = FirstWord(stmt);
      if (first == "import" || first == "from") ret.imports.emplace_back(stmt);
      begin = end + 1;
    };
    for (size_t pos : lines[i].semicolons) AddStatement(pos);
    if (begin < lines[i].end) AddStatement(lines[i].end);
    i++;
  }
  return ret;
}
