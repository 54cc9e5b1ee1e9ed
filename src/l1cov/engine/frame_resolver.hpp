#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace l1cov {

struct source_position {
  std::string path;
  uint32_t line = 0;
};

// maps a call stack depth of the instrumented program to a source position.
// depth 0 is the innermost frame as seen by the caller.
class frame_resolver {
public:
  virtual ~frame_resolver() = default;

  virtual std::optional<source_position> resolve(int stack_depth) const = 0;
};

} // namespace l1cov
