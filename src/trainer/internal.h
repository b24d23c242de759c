#ifndef TRAINER_INTERNAL_H_
#define TRAINER_INTERNAL_H_

#include <string>
#include <filesystem>

#include <trainer/utils.h>

namespace fs = std::filesystem;

#define IGNORE_RETURN(x) { auto _ __attribute__((unused)) = x; }

// trailing whitespace only; used for diagnostics
std::string RightTrim(std::string);

#endif  // TRAINER_INTERNAL_H_
