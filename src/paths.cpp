#include "paths.h"

fs::path kDatabasePath = fs::path(TRAINER_DATA_DIR) / "trainer.sqlite";
fs::path kSamplesCachePath = fs::path(TRAINER_DATA_DIR) / "samples_cache.json";
fs::path kSolutionTemplatePath;
