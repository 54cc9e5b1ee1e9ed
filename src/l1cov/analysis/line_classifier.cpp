#include "l1cov/analysis/line_classifier.hpp"

#include <cctype>

#include "l1cov/analysis/tokenizer.hpp"
#include "l1cov/util/string_utils.hpp"

namespace l1cov::analysis {
namespace {

constexpr size_t npos = std::string_view::npos;

// recognizes "[", "=" * level, "[" at pos
bool long_bracket_open_at(std::string_view line, size_t pos, size_t& level) {
  if (pos >= line.size() || line[pos] != '[') {
    return false;
  }
  size_t i = pos + 1;
  size_t equals = 0;
  while (i < line.size() && line[i] == '=') {
    ++equals;
    ++i;
  }
  if (i >= line.size() || line[i] != '[') {
    return false;
  }
  level = equals;
  return true;
}

// returns the index just past the closing bracket of the given level, or npos
size_t find_long_bracket_close(std::string_view line, size_t from, size_t level) {
  size_t i = from;
  while (i < line.size()) {
    size_t close = line.find(']', i);
    if (close == npos) {
      return npos;
    }
    size_t j = close + 1;
    size_t equals = 0;
    while (j < line.size() && line[j] == '=') {
      ++equals;
      ++j;
    }
    if (equals == level && j < line.size() && line[j] == ']') {
      return j + 1;
    }
    i = close + 1;
  }
  return npos;
}

// returns the index just past the closing quote, or npos when the string runs off the line
size_t find_short_string_close(std::string_view line, size_t from, char quote) {
  size_t i = from;
  while (i < line.size()) {
    char ch = line[i];
    if (ch == '\\') {
      i += 2;
      continue;
    }
    if (ch == quote) {
      return i + 1;
    }
    ++i;
  }
  return npos;
}

bool ends_with_continuation(std::string_view line) {
  size_t backslashes = 0;
  size_t i = line.size();
  while (i > 0 && line[i - 1] == '\\') {
    ++backslashes;
    --i;
  }
  return (backslashes % 2) == 1;
}

bool is_closing_token(const token& tok) {
  return tok.is("end") || tok.is("else") || tok.is(")") || tok.is("]") || tok.is("}") || tok.is(",") ||
         tok.is(";");
}

bool is_block_keyword(const token& tok) {
  return tok.is("if") || tok.is("elseif") || tok.is("while") || tok.is("for") || tok.is("repeat") || tok.is("do");
}

} // namespace

std::vector<scanned_line> line_classifier::scan(const std::vector<std::string>& lines) const {
  std::vector<scanned_line> scanned;
  scanned.reserve(lines.size());

  lexer_state state;
  for (const auto& line : lines) {
    scanned.push_back(scan_line(line, state));
  }
  return scanned;
}

std::vector<scanned_line> line_classifier::scan(std::string_view source_text) const {
  return scan(util::split_lines(source_text));
}

scanned_line line_classifier::scan_line(std::string_view line, lexer_state& state) const {
  scanned_line out;
  bool has_code = false;
  size_t i = 0;

  // finish whatever the previous line left open
  switch (state.current) {
  case lexer_state::mode::long_comment:
  case lexer_state::mode::long_string: {
    size_t close = find_long_bracket_close(line, 0, state.level);
    if (close == npos) {
      return out;
    }
    state.current = lexer_state::mode::code;
    state.level = 0;
    i = close;
    break;
  }
  case lexer_state::mode::short_string: {
    size_t close = find_short_string_close(line, 0, state.quote);
    if (close == npos) {
      if (!ends_with_continuation(line)) {
        // unterminated string, resume lexing as code on the next line
        state.current = lexer_state::mode::code;
        state.quote = 0;
      }
      return out;
    }
    state.current = lexer_state::mode::code;
    state.quote = 0;
    i = close;
    break;
  }
  case lexer_state::mode::code:
  default:
    break;
  }

  while (i < line.size()) {
    char ch = line[i];

    if (std::isspace(static_cast<unsigned char>(ch))) {
      out.code.push_back(' ');
      ++i;
      continue;
    }

    if (ch == '-' && i + 1 < line.size() && line[i + 1] == '-') {
      size_t level = 0;
      if (long_bracket_open_at(line, i + 2, level)) {
        size_t body = i + 2 + level + 2;
        size_t close = find_long_bracket_close(line, body, level);
        if (close == npos) {
          state.current = lexer_state::mode::long_comment;
          state.level = level;
          break;
        }
        out.code.push_back(' ');
        i = close;
        continue;
      }
      // line comment runs to the end of the line
      break;
    }

    if (ch == '[') {
      size_t level = 0;
      if (long_bracket_open_at(line, i, level)) {
        has_code = true;
        out.code += "\"\"";
        size_t body = i + level + 2;
        size_t close = find_long_bracket_close(line, body, level);
        if (close == npos) {
          state.current = lexer_state::mode::long_string;
          state.level = level;
          break;
        }
        i = close;
        continue;
      }
    }

    if (ch == '"' || ch == '\'') {
      has_code = true;
      out.code += "\"\"";
      size_t close = find_short_string_close(line, i + 1, ch);
      if (close == npos) {
        if (ends_with_continuation(line)) {
          state.current = lexer_state::mode::short_string;
          state.quote = ch;
        }
        break;
      }
      i = close;
      continue;
    }

    has_code = true;
    out.code.push_back(ch);
    ++i;
  }

  if (!has_code) {
    out.code.clear();
    out.kind = line_kind::non_executable;
    return out;
  }

  out.code = util::trim_copy(out.code);
  out.kind = classify_code(out.code);
  return out;
}

line_kind line_classifier::classify_code(std::string_view code) {
  std::vector<token> tokens = tokenize(code);
  if (tokens.empty()) {
    return line_kind::non_executable;
  }

  bool only_closing = true;
  for (const auto& tok : tokens) {
    if (!is_closing_token(tok)) {
      only_closing = false;
      break;
    }
  }
  if (only_closing) {
    return line_kind::block_end;
  }

  if (is_block_keyword(tokens.front())) {
    return line_kind::block_start;
  }

  for (const auto& tok : tokens) {
    if (tok.is("function")) {
      return line_kind::block_start;
    }
  }

  return line_kind::executable;
}

std::vector<line_kind> classify(std::string_view source_text) {
  line_classifier classifier;
  std::vector<scanned_line> scanned = classifier.scan(source_text);

  std::vector<line_kind> kinds;
  kinds.reserve(scanned.size());
  for (const auto& line : scanned) {
    kinds.push_back(line.kind);
  }
  return kinds;
}

} // namespace l1cov::analysis
