#pragma once

#include <string>
#include <string_view>

namespace l1cov::util {

// path glob matching
//  *   any run of characters except '/'
//  **  any run of characters including '/'; "**/" also matches no directory
//  ?   a single character except '/'
//  [.] character class, '!' or '^' negates, ranges with '-'
//  \x  literal x
bool glob_match(std::string_view pattern, std::string_view path);

// returns an empty string when the pattern is usable, otherwise the reason it is not
std::string glob_validation_error(std::string_view pattern);

} // namespace l1cov::util
