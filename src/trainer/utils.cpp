#include "internal.h"

#include <cctype>
#include <cstring>
#include <fstream>
#include <algorithm>

#include <spdlog/spdlog.h>

#define ENUM_SWITCH_FUNCTION(DEF, typ, mac) \
  DEF(typ param) { \
    switch (param) { \
      mac \
    } \
    __builtin_unreachable(); \
  }
#define X_RETURN_ARG3(cls, x, y, z, ...) case cls::x: return z;

#define X(...) X_RETURN_ARG3(Verdict, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* VerdictToDesc, Verdict, ENUM_VERDICT_)
#undef X

#define X(...) X_RETURN_ARG3(Rating, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* RatingName, Rating, ENUM_RATING_)
#undef X

#undef ENUM_SWITCH_FUNCTION
#undef X_RETURN_ARG3

static const char* kVerdictAbrTable[] = {
#define X(name, abr, desc) abr,
  ENUM_VERDICT_
#undef X
};

const char* VerdictToAbr(Verdict verdict) {
  return kVerdictAbrTable[(int)verdict];
}

std::optional<Rating> ParseRating(const std::string& str) {
  std::string lower(str);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });
#define X(name, val, name_str) \
  if (lower == #val || lower == name_str) return Rating::name;
  ENUM_RATING_
#undef X
  return std::nullopt;
}

bool CreateDirs(const fs::path& path, fs::perms perms) {
  spdlog::debug("Create directories {}", path.c_str());
  std::error_code ec;
  fs::create_directories(path, ec);
  if (ec) goto err;
  if (perms == fs::perms::unknown) return true;
  fs::permissions(path, perms, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed creating directory {}: {}", path.c_str(), strerror(ec.value()));
  return false;
}

bool ReadFile(const fs::path& path, std::string& content) {
  std::ifstream fin(path, std::ios::binary);
  if (!fin) {
    spdlog::warn("Failed opening {} for reading", path.c_str());
    return false;
  }
  content.assign(std::istreambuf_iterator<char>(fin), std::istreambuf_iterator<char>());
  return true;
}

bool WriteFile(const fs::path& path, const std::string& content) {
  spdlog::debug("Write file {} ({} bytes)", path.c_str(), content.size());
  std::ofstream fout(path, std::ios::binary | std::ios::trunc);
  if (!fout || !fout.write(content.data(), content.size())) {
    spdlog::warn("Failed writing {}", path.c_str());
    return false;
  }
  return true;
}

std::string RightTrim(std::string str) {
  constexpr char kWhites[] = " \n\r\t\x0b\x0c";
  // std::string::npos + 1 == 0
  str.erase(str.find_last_not_of(kWhites) + 1);
  return str;
}
