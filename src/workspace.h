#ifndef WORKSPACE_H_
#define WORKSPACE_H_

#include <string>
#include <vector>
#include <optional>
#include <filesystem>

#include <trainer/review.h>
#include "database.h"
#include "samples.h"

namespace fs = std::filesystem;

extern const char kDefaultSolutionTemplate[];

// template file contents, or the built-in template when path is empty
std::string LoadSolutionTemplate(const fs::path& path);

// Create <workspace_root>/<contest>/<problem_id>, write solution.cpp from the
// template unless it exists, and seed test_1.in/.out from the first sample.
// Throws SamplesNotFound (before touching the filesystem) or std::runtime_error.
fs::path SetupWorkspace(const std::string& contest, long problem_id,
                        const SampleStore& samples, const std::string& solution_template);

bool WriteStartMarker(const fs::path& workspace, TimePoint started);
std::optional<TimePoint> ReadStartMarker(const fs::path& workspace);

// {"contest_id": ..., "problems": [{"title", "body", "samples": [{"in", "out"}]}]}
// Inserts the problems and caches their samples; returns the new problem ids.
std::vector<long> ImportContest(const fs::path& file, Database& db, SampleStore& samples);

#endif  // WORKSPACE_H_
