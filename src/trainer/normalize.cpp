#include <trainer/normalize.h>

namespace {

constexpr char kWhites[] = " \n\r\t\x0b\x0c";

} // namespace

std::string NormalizeOutput(std::string_view text) {
  std::string unified;
  unified.reserve(text.size());
  for (size_t i = 0; i < text.size(); i++) {
    if (text[i] == '\r') {
      unified.push_back('\n');
      if (i + 1 < text.size() && text[i + 1] == '\n') i++;
    } else {
      unified.push_back(text[i]);
    }
  }
  size_t begin = unified.find_first_not_of(kWhites);
  if (begin == std::string::npos) return "";
  size_t end = unified.find_last_not_of(kWhites) + 1;

  std::string ret;
  ret.reserve(end - begin);
  for (size_t pos = begin; pos < end;) {
    size_t eol = unified.find('\n', pos);
    if (eol == std::string::npos || eol > end) eol = end;
    std::string_view line(unified.data() + pos, eol - pos);
    // std::string_view::npos + 1 == 0
    line = line.substr(0, line.find_last_not_of(kWhites) + 1);
    ret.append(line);
    if (eol < end) ret.push_back('\n');
    pos = eol + 1;
  }
  return ret;
}

bool OutputMatches(std::string_view expected, std::string_view actual) {
  return NormalizeOutput(expected) == NormalizeOutput(actual);
}
