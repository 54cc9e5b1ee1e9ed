#include "l1cov/analysis/structure_analyzer.hpp"

#include <redlog.hpp>

#include "l1cov/analysis/tokenizer.hpp"

namespace l1cov::analysis {
namespace {

constexpr size_t no_function = static_cast<size_t>(-1);

struct open_block {
  size_t block_index = 0;
  size_t function_index = no_function;
};

class block_builder {
public:
  explicit block_builder(source_structure& out) : out_(out) {}

  void open(block_type type, uint32_t line, size_t function_index = no_function) {
    block_descriptor block;
    block.type = type;
    block.start_line = line;
    out_.blocks.push_back(block);
    parents_.push_back(stack_.empty() ? no_function : stack_.back().block_index);
    stack_.push_back(open_block{out_.blocks.size() - 1, function_index});
  }

  bool close(uint32_t line) {
    if (stack_.empty()) {
      return false;
    }
    open_block top = stack_.back();
    stack_.pop_back();
    out_.blocks[top.block_index].end_line = line;
    if (top.function_index != no_function) {
      out_.functions[top.function_index].end_line = line;
    }
    return true;
  }

  bool top_is(block_type type) const { return !stack_.empty() && out_.blocks[stack_.back().block_index].type == type; }

  size_t unclosed() const { return stack_.size(); }

  void finish(uint32_t last_line) {
    while (!stack_.empty()) {
      const uint32_t start = out_.blocks[stack_.back().block_index].start_line;
      close(last_line < start ? start : last_line);
    }

    for (size_t i = 0; i < out_.blocks.size(); ++i) {
      if (parents_[i] != no_function) {
        out_.blocks[i].parent = out_.blocks[parents_[i]].key();
      }
    }
  }

private:
  source_structure& out_;
  std::vector<open_block> stack_;
  std::vector<size_t> parents_;
};

// "a.b:c" starting at tokens[k]; advances k past the name
std::string read_dotted_name(const std::vector<token>& tokens, size_t& k) {
  std::string name;
  while (k < tokens.size() && tokens[k].is_name() && !is_keyword(tokens[k].text)) {
    name += tokens[k].text;
    ++k;
    if (k + 1 < tokens.size() && (tokens[k].is(".") || tokens[k].is(":")) && tokens[k + 1].is_name()) {
      name += tokens[k].text;
      ++k;
      continue;
    }
    break;
  }
  return name;
}

// name for "x = function" / "local x = function" / "t.x = function" / "{ x = function"
std::string assigned_name(const std::vector<token>& tokens, size_t function_pos) {
  if (function_pos < 2 || !tokens[function_pos - 1].is("=")) {
    return std::string();
  }

  size_t end = function_pos - 1;
  size_t start = end;
  while (start > 0) {
    const token& candidate = tokens[start - 1];
    if (candidate.is_name() && !is_keyword(candidate.text)) {
      --start;
      if (start > 0 && (tokens[start - 1].is(".") || tokens[start - 1].is(":"))) {
        --start;
        continue;
      }
      break;
    }
    break;
  }

  if (start == end) {
    return std::string();
  }
  return join_tokens(tokens, start, end);
}

bool is_condition_keyword(const token& tok) {
  return tok.is("if") || tok.is("elseif") || tok.is("while") || tok.is("until");
}

} // namespace

source_structure structure_analyzer::analyze(const std::vector<scanned_line>& lines) const {
  source_structure out;
  block_builder blocks(out);
  bool pending_do = false;

  for (size_t i = 0; i < lines.size(); ++i) {
    const uint32_t line_number = static_cast<uint32_t>(i + 1);
    if (lines[i].code.empty()) {
      continue;
    }

    std::vector<token> tokens = tokenize(lines[i].code);

    for (size_t k = 0; k < tokens.size(); ++k) {
      const token& tok = tokens[k];
      if (!tok.is_name()) {
        continue;
      }

      if (tok.is("function")) {
        std::string name;
        size_t next = k + 1;
        if (next < tokens.size() && tokens[next].is_name()) {
          name = read_dotted_name(tokens, next);
        } else {
          name = assigned_name(tokens, k);
        }
        out.functions.push_back(function_descriptor{name, line_number, 0});
        blocks.open(block_type::function_body, line_number, out.functions.size() - 1);
      } else if (tok.is("if")) {
        blocks.open(block_type::branch, line_number);
      } else if (tok.is("elseif") || tok.is("else")) {
        if (blocks.top_is(block_type::branch)) {
          blocks.close(line_number);
        }
        blocks.open(block_type::branch, line_number);
      } else if (tok.is("while") || tok.is("for")) {
        blocks.open(block_type::loop, line_number);
        pending_do = true;
      } else if (tok.is("do")) {
        if (pending_do) {
          pending_do = false;
        } else {
          blocks.open(block_type::other, line_number);
        }
      } else if (tok.is("repeat")) {
        blocks.open(block_type::loop, line_number);
      } else if (tok.is("until") || tok.is("end")) {
        blocks.close(line_number);
      }
    }

    std::vector<std::string> operands = condition_operands(lines[i].code);
    for (size_t index = 0; index < operands.size(); ++index) {
      out.conditions.push_back(condition_descriptor{line_number, static_cast<uint32_t>(index), operands[index]});
    }
  }

  if (blocks.unclosed() > 0) {
    redlog::get_logger("l1cov.structure")
        .dbg("closing unterminated blocks at end of file", redlog::field("count", blocks.unclosed()));
  }
  blocks.finish(static_cast<uint32_t>(lines.size()));
  return out;
}

std::vector<std::string> structure_analyzer::condition_operands(const std::string& code) {
  std::vector<token> tokens = tokenize(code);
  if (tokens.empty() || !is_condition_keyword(tokens.front())) {
    return {};
  }

  const bool is_while = tokens.front().is("while");
  const bool is_until = tokens.front().is("until");

  std::vector<std::string> operands;
  int depth = 0;
  size_t operand_start = 1;
  size_t k = 1;

  for (; k < tokens.size(); ++k) {
    const token& tok = tokens[k];
    if (tok.is("(") || tok.is("[") || tok.is("{")) {
      ++depth;
      continue;
    }
    if (tok.is(")") || tok.is("]") || tok.is("}")) {
      --depth;
      continue;
    }
    if (depth > 0) {
      continue;
    }
    if ((!is_while && !is_until && tok.is("then")) || (is_while && tok.is("do"))) {
      break;
    }
    if (is_until && (tok.is(";") || (tok.is_name() && is_keyword(tok.text) && !tok.is("and") && !tok.is("or") &&
                                     !tok.is("not") && !tok.is("nil") && !tok.is("true") && !tok.is("false")))) {
      break;
    }
    if (tok.is("and") || tok.is("or")) {
      if (k > operand_start) {
        operands.push_back(join_tokens(tokens, operand_start, k));
      }
      operand_start = k + 1;
    }
  }

  if (k > operand_start) {
    operands.push_back(join_tokens(tokens, operand_start, k));
  }
  return operands;
}

} // namespace l1cov::analysis
