#ifndef INCLUDE_TRAINER_PATHS_H_
#define INCLUDE_TRAINER_PATHS_H_

#include <mutex>
#include <string>
#include <filesystem>
#include <unordered_map>

namespace fs = std::filesystem;

extern fs::path kWorkspaceRoot;

// Serializes read-modify-write sequences keyed by problem id
class ProblemLock {
  std::mutex global_lock_;
  std::unordered_map<long, std::mutex> mutex_map_;
 public:
  std::mutex& operator[](long id);
};
extern ProblemLock problem_lock;

// <workspace_root>/<contest>/<problem_id>
fs::path WorkspacePath(const std::string& contest, long problem_id);
fs::path SolutionPath(const fs::path& workspace);
fs::path BinaryPath(const fs::path& workspace);
fs::path CompileMessagePath(const fs::path& workspace);
fs::path WorkspaceLockPath(const fs::path& workspace);
fs::path StartMarkerPath(const fs::path& workspace);
// test_<index>.in / test_<index>.out; index starts from 1
fs::path TestInputPath(const fs::path& workspace, int index);
fs::path TestAnswerPath(const fs::path& workspace, int index);
// foo.in -> foo.out
fs::path AnswerPathFor(const fs::path& input);

#endif  // INCLUDE_TRAINER_PATHS_H_
