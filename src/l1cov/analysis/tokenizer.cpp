#include "l1cov/analysis/tokenizer.hpp"

#include <array>
#include <cctype>

#include "l1cov/util/string_utils.hpp"

namespace l1cov::analysis {
namespace {

constexpr std::array<std::string_view, 22> k_keywords = {
    "and",   "break", "do",  "else", "elseif", "end",    "false", "for",  "function", "goto",  "if",
    "in",    "local", "nil", "not",  "or",     "repeat", "return", "then", "true",     "until", "while",
};

constexpr std::array<std::string_view, 9> k_two_char_symbols = {
    "==", "~=", "<=", ">=", "..", "::", "//", "<<", ">>",
};

bool is_two_char_symbol(std::string_view code, size_t i) {
  if (i + 1 >= code.size()) {
    return false;
  }
  std::string_view candidate = code.substr(i, 2);
  for (std::string_view symbol : k_two_char_symbols) {
    if (candidate == symbol) {
      return true;
    }
  }
  return false;
}

bool needs_space(const token& prev, const token& next) {
  if (prev.is("(") || prev.is("[") || prev.is(".") || prev.is(":") || prev.is("#")) {
    return false;
  }
  if (next.is(")") || next.is("]") || next.is(",") || next.is(".") || next.is(":") || next.is(";")) {
    return false;
  }
  if (next.is("(") || next.is("[")) {
    return !(prev.is_name() && !is_keyword(prev.text)) && !prev.is(")") && !prev.is("]");
  }
  return true;
}

} // namespace

bool is_keyword(std::string_view word) {
  for (std::string_view keyword : k_keywords) {
    if (keyword == word) {
      return true;
    }
  }
  return false;
}

std::vector<token> tokenize(std::string_view code) {
  std::vector<token> tokens;
  size_t i = 0;

  while (i < code.size()) {
    char ch = code[i];

    if (std::isspace(static_cast<unsigned char>(ch))) {
      ++i;
      continue;
    }

    if (util::is_identifier_start(ch)) {
      size_t start = i;
      while (i < code.size() && util::is_identifier_char(code[i])) {
        ++i;
      }
      tokens.push_back(token{token_kind::name, std::string(code.substr(start, i - start))});
      continue;
    }

    if (std::isdigit(static_cast<unsigned char>(ch)) ||
        (ch == '.' && i + 1 < code.size() && std::isdigit(static_cast<unsigned char>(code[i + 1])))) {
      size_t start = i;
      while (i < code.size() && (util::is_identifier_char(code[i]) || code[i] == '.')) {
        char previous = code[i];
        ++i;
        // exponent signs belong to the number
        if ((previous == 'e' || previous == 'E' || previous == 'p' || previous == 'P') && i < code.size() &&
            (code[i] == '+' || code[i] == '-')) {
          ++i;
        }
      }
      tokens.push_back(token{token_kind::number, std::string(code.substr(start, i - start))});
      continue;
    }

    if (ch == '"' && i + 1 < code.size() && code[i + 1] == '"') {
      tokens.push_back(token{token_kind::string, "\"\""});
      i += 2;
      continue;
    }

    if (is_two_char_symbol(code, i)) {
      if (code.substr(i, 3) == "...") {
        tokens.push_back(token{token_kind::symbol, "..."});
        i += 3;
        continue;
      }
      tokens.push_back(token{token_kind::symbol, std::string(code.substr(i, 2))});
      i += 2;
      continue;
    }

    tokens.push_back(token{token_kind::symbol, std::string(1, ch)});
    ++i;
  }

  return tokens;
}

std::string join_tokens(const std::vector<token>& tokens, size_t first, size_t last) {
  std::string out;
  for (size_t i = first; i < last && i < tokens.size(); ++i) {
    if (i > first && needs_space(tokens[i - 1], tokens[i])) {
      out.push_back(' ');
    }
    out += tokens[i].text;
  }
  return out;
}

} // namespace l1cov::analysis
