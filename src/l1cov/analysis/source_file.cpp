#include "l1cov/analysis/source_file.hpp"

#include "l1cov/analysis/line_classifier.hpp"
#include "l1cov/util/string_utils.hpp"

namespace l1cov::analysis {
namespace {

const std::string k_empty_line;

} // namespace

std::shared_ptr<const source_file> source_file::create(std::string path, std::string_view source_text) {
  std::shared_ptr<source_file> file(new source_file());
  file->path_ = std::move(path);
  file->text_ = std::string(source_text);
  file->lines_ = util::split_lines(file->text_);

  line_classifier classifier;
  std::vector<scanned_line> scanned = classifier.scan(file->lines_);

  file->kinds_.reserve(scanned.size());
  for (const auto& line : scanned) {
    file->kinds_.push_back(line.kind);
    if (counts_as_executable(line.kind)) {
      ++file->executable_lines_;
    }
  }

  structure_analyzer analyzer;
  file->structure_ = analyzer.analyze(scanned);
  return file;
}

line_kind source_file::kind(uint32_t line) const {
  if (line == 0 || line > kinds_.size()) {
    return line_kind::non_executable;
  }
  return kinds_[line - 1];
}

const std::string& source_file::line_text(uint32_t line) const {
  if (line == 0 || line > lines_.size()) {
    return k_empty_line;
  }
  return lines_[line - 1];
}

} // namespace l1cov::analysis
