#ifndef INCLUDE_TRAINER_UTILS_H_
#define INCLUDE_TRAINER_UTILS_H_

#include <string>
#include <optional>
#include <filesystem>

#include "verifier.h"
#include "review.h"

const char* VerdictToDesc(Verdict);
const char* VerdictToAbr(Verdict);

const char* RatingName(Rating);
// accepts "1".."4" or the case-insensitive rating name
std::optional<Rating> ParseRating(const std::string&);

// filesystem helpers; failures are logged and reported as false
bool CreateDirs(const std::filesystem::path&, std::filesystem::perms = std::filesystem::perms::unknown);

bool ReadFile(const std::filesystem::path&, std::string& content);
bool WriteFile(const std::filesystem::path&, const std::string& content);

#endif  // INCLUDE_TRAINER_UTILS_H_
