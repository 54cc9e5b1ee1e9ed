#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace l1cov::analysis {

enum class token_kind {
  name,
  number,
  string,
  symbol,
};

struct token {
  token_kind kind = token_kind::symbol;
  std::string text;

  bool is(std::string_view value) const { return text == value; }
  bool is_name() const { return kind == token_kind::name; }
};

// splits comment-free code text into lua tokens; string literals arrive as "" placeholders
std::vector<token> tokenize(std::string_view code);

bool is_keyword(std::string_view word);

// joins tokens [first, last) back into readable source text
std::string join_tokens(const std::vector<token>& tokens, size_t first, size_t last);

} // namespace l1cov::analysis
