#include <trainer/paths.h>

fs::path kWorkspaceRoot = "workspace";

namespace {

constexpr char kSolutionName[] = "solution.cpp";
constexpr char kBinaryName[] = "solution_bin";

} // namespace

std::mutex& ProblemLock::operator[](long id) {
  std::lock_guard lck(global_lock_);
  return mutex_map_[id];
}
ProblemLock problem_lock;

fs::path WorkspacePath(const std::string& contest, long problem_id) {
  return kWorkspaceRoot / contest / std::to_string(problem_id);
}
fs::path SolutionPath(const fs::path& workspace) {
  return workspace / kSolutionName;
}
fs::path BinaryPath(const fs::path& workspace) {
  return workspace / kBinaryName;
}
fs::path CompileMessagePath(const fs::path& workspace) {
  return workspace / "compile.log";
}
fs::path WorkspaceLockPath(const fs::path& workspace) {
  return workspace / ".lock";
}
fs::path StartMarkerPath(const fs::path& workspace) {
  return workspace / ".started";
}

fs::path TestInputPath(const fs::path& workspace, int index) {
  return workspace / ("test_" + std::to_string(index) + ".in");
}
fs::path TestAnswerPath(const fs::path& workspace, int index) {
  return workspace / ("test_" + std::to_string(index) + ".out");
}
fs::path AnswerPathFor(const fs::path& input) {
  fs::path ret = input;
  ret.replace_extension(".out");
  return ret;
}
