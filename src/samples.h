#ifndef SAMPLES_H_
#define SAMPLES_H_

#include <string>
#include <vector>
#include <stdexcept>
#include <filesystem>

#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

struct TestCase {
  std::string input;
  std::string output;
};

class SamplesNotFound : public std::runtime_error {
 public:
  SamplesNotFound(const std::string& contest, const std::string& problem_id) :
      std::runtime_error("No cached samples found for contest='" + contest +
                         "', problem_id='" + problem_id + "'") {}
};

// Cached sample tests, keyed by contest and problem. Accepted layouts:
//   {contest: {problem: {"samples": [...]}}}, {contest: {problem: [...]}},
//   {"contest/problem": ...}; each sample is {"in": ..., "out": ...}.
class SampleStore {
  fs::path cache_file_;
  nlohmann::json cache_;
 public:
  // a missing file is an empty cache; a malformed one throws std::runtime_error
  explicit SampleStore(fs::path cache_file);
  explicit SampleStore(nlohmann::json cache);

  // ordered; throws SamplesNotFound if nothing usable is cached
  std::vector<TestCase> Get(const std::string& contest, const std::string& problem_id) const;
  void Put(const std::string& contest, const std::string& problem_id, const std::vector<TestCase>&);
  // no-op for a store without a file
  bool Save() const;
};

#endif  // SAMPLES_H_
