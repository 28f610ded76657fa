#ifndef DLSCRIPT_UTIL_STRING_H_
#define DLSCRIPT_UTIL_STRING_H_

#include <string>
#include <string_view>

namespace dlscript::util {

inline std::string Trim(std::string_view input) {
  size_t start = 0;
  while (start < input.size() && (input[start] == ' ' || input[start] == '\t' ||
                                  input[start] == '\n' || input[start] == '\r')) {
    ++start;
  }
  size_t end = input.size();
  while (end > start && (input[end - 1] == ' ' || input[end - 1] == '\t' ||
                         input[end - 1] == '\n' || input[end - 1] == '\r')) {
    --end;
  }
  return std::string(input.substr(start, end - start));
}

}  // namespace dlscript::util

#endif  // DLSCRIPT_UTIL_STRING_H_
