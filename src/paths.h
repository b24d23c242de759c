#ifndef PATHS_H_
#define PATHS_H_

#include <filesystem>

namespace fs = std::filesystem;

extern fs::path kDatabasePath;
extern fs::path kSamplesCachePath;
// empty for the built-in template
extern fs::path kSolutionTemplatePath;

#endif
