#ifndef INCLUDE_TRAINER_NORMALIZE_H_
#define INCLUDE_TRAINER_NORMALIZE_H_

#include <string>
#include <string_view>

// CRLF/CR -> LF, strip surrounding blank content, strip trailing whitespace of each line.
// Two outputs are accepted as equal iff their normalized forms are equal.
std::string NormalizeOutput(std::string_view);

bool OutputMatches(std::string_view expected, std::string_view actual);

#endif  // INCLUDE_TRAINER_NORMALIZE_H_
