#include <trainer/verifier.h>

#include <fcntl.h>
#include <unistd.h>
#include <sys/file.h>
#include <cerrno>
#include <cstring>
#include <algorithm>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include <trainer/paths.h>
#include <trainer/normalize.h>
#include "internal.h"

std::string kCompiler = "g++";
std::vector<std::string> kCompileFlags = {"-O2"};
long kCompileTimeUs = 60L * 1'000'000;
long kRunTimeUs = 10L * 1'000'000;
long kMaxOutput = 64 * 1024; // 64M

namespace {

constexpr size_t kMaxMsgLen = 4000;
constexpr char kInputExtension[] = ".in";

// Advisory lock on the workspace for the whole run; released on destruction
class WorkspaceLock {
  int fd_;
  int error_; // errno of a failure other than contention
 public:
  explicit WorkspaceLock(const fs::path& workspace) : fd_(-1), error_(0) {
    int fd = open(WorkspaceLockPath(workspace).c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
      error_ = errno;
      spdlog::warn("Failed opening workspace lock in {}: {}", workspace.c_str(), strerror(error_));
      return;
    }
    if (flock(fd, LOCK_EX | LOCK_NB) < 0) {
      if (errno != EWOULDBLOCK) {
        error_ = errno;
        spdlog::warn("Failed locking workspace {}: {}", workspace.c_str(), strerror(error_));
      }
      close(fd);
      return;
    }
    fd_ = fd;
  }
  ~WorkspaceLock() {
    if (fd_ >= 0) close(fd_); // releases the flock
  }
  WorkspaceLock(const WorkspaceLock&) = delete;
  WorkspaceLock& operator=(const WorkspaceLock&) = delete;

  explicit operator bool() const { return fd_ >= 0; }
  int Error() const { return error_; }
};

inline bool IsCancelled(const VerifyOptions& opt) {
  return opt.cancel && opt.cancel->load();
}

inline std::string CaseName(const VerificationResult::CaseResult& td) {
  return td.input_file.filename().string();
}

std::vector<std::string> CompileCommand(const VerifyOptions& opt, const fs::path& source, const fs::path& output) {
  std::vector<std::string> ret = {opt.compiler};
  ret.insert(ret.end(), opt.compile_flags.begin(), opt.compile_flags.end());
  ret.insert(ret.end(), {source.string(), "-o", output.string()});
  return ret;
}

std::vector<fs::path> ListInputs(const fs::path& workspace) {
  std::vector<fs::path> ret;
  std::error_code ec;
  for (auto& entry : fs::directory_iterator(workspace, ec)) {
    if (entry.path().extension() == kInputExtension && entry.is_regular_file(ec)) {
      ret.push_back(entry.path());
    }
  }
  if (ec) spdlog::warn("Failed listing {}: {}", workspace.c_str(), ec.message());
  std::sort(ret.begin(), ret.end(), [](const fs::path& a, const fs::path& b) {
    return a.filename().string() < b.filename().string();
  });
  return ret;
}

std::string FormatCompileMessage(const ExecResult& res) {
  std::string message = res.error_output;
  if (!res.output.empty()) {
    if (!message.empty() && message.back() != '\n') message += '\n';
    message += res.output;
  }
  if (RightTrim(message).empty()) return "Compilation failed.";
  if (message.size() > kMaxMsgLen) {
    message.resize(kMaxMsgLen);
    message += "\n[Error message truncated after " + std::to_string(kMaxMsgLen) + " bytes]";
  }
  return message;
}

/// compile step; returns false if no test case should run
bool Compile(const fs::path& source, const fs::path& workspace, const VerifyOptions& opt,
             VerificationResult& result) {
  if (opt.reporter.ReportStartCompiling) opt.reporter.ReportStartCompiling(source);
  fs::path binary = fs::absolute(BinaryPath(workspace));
  std::error_code ec;
  fs::remove(binary, ec); // never run a stale binary

  ExecOptions exec;
  exec.command = CompileCommand(opt, fs::absolute(source), binary);
  exec.workdir = workspace.string();
  exec.wall_time = opt.compile_time;
  exec.max_output = opt.max_output;
  exec.cancel = opt.cancel;
  spdlog::debug("Compile command: {}", fmt::format("{}", exec.command));
  ExecResult res = Execute(exec);

  if (res.cancelled) {
    result.verdict = Verdict::CAN;
  } else if (res.error) {
    result.verdict = Verdict::EE;
    result.compile_message = fmt::format("Failed to run compiler {}: {}", opt.compiler, strerror(res.error));
  } else if (res.timed_out) {
    result.verdict = Verdict::CLE;
    result.compile_message = fmt::format("Compilation time limit exceeded ({} ms)", opt.compile_time / 1000);
  } else if (res.exit_code != 0 || !fs::is_regular_file(binary)) {
    result.verdict = Verdict::CE;
    result.compile_message = FormatCompileMessage(res);
    WriteFile(CompileMessagePath(workspace), res.error_output + res.output);
  }
  if (result.verdict != Verdict::NUL) {
    spdlog::info("Compilation failed: source={} verdict={} exit_code={}",
                 source.c_str(), VerdictToAbr(result.verdict), res.exit_code);
    result.diagnostics = result.compile_message;
  } else {
    spdlog::info("Compilation successful: source={} time={}", source.c_str(), res.wall_time);
  }
  if (opt.reporter.ReportCompileResult) opt.reporter.ReportCompileResult(result);
  return result.verdict == Verdict::NUL;
}

void FinalizeCase(VerificationResult::CaseResult& td, const std::string& expected, const VerifyOptions& opt) {
  const ExecResult& res = td.execute_result;
  const std::string name = CaseName(td);
  if (res.error) {
    td.verdict = Verdict::EE;
    td.message = fmt::format("[{}] Execution error: {}", name, strerror(res.error));
  } else if (res.cancelled) {
    td.verdict = Verdict::CAN;
  } else if (res.timed_out) {
    td.verdict = Verdict::TLE;
    td.message = fmt::format("[{}] Time limit exceeded ({} ms)", name, opt.run_time / 1000);
  } else if (res.output_exceeded) {
    td.verdict = Verdict::OLE;
    td.message = fmt::format("[{}] Output limit exceeded ({} KiB)", name, opt.max_output);
  } else if (res.signal) {
    td.verdict = Verdict::SIG;
    td.message = fmt::format("[{}] Runtime error (signal {}: {}):\n{}",
                             name, res.signal, strsignal(res.signal), RightTrim(res.error_output));
  } else if (res.exit_code != 0) {
    td.verdict = Verdict::RE;
    td.message = fmt::format("[{}] Runtime error (code {}):\n{}",
                             name, res.exit_code, RightTrim(res.error_output));
  } else if (!OutputMatches(expected, res.output)) {
    td.verdict = Verdict::WA;
    td.message = fmt::format("[{}] Wrong answer\nExpected:\n{}\nGot:\n{}",
                             name, RightTrim(expected), RightTrim(res.output));
  } else {
    td.verdict = Verdict::AC;
  }
  spdlog::info("Execute finished: case={} exit_code={} signal={} verdict={} time={}",
               name, res.exit_code, res.signal, VerdictToAbr(td.verdict), res.wall_time);
}

void RunCase(VerificationResult::CaseResult& td, const fs::path& workspace, const VerifyOptions& opt) {
  if (!fs::is_regular_file(td.answer_file)) {
    td.verdict = Verdict::MF;
    td.message = "Missing expected output file: " + td.answer_file.filename().string();
    spdlog::info("Skip case={}: {}", CaseName(td), td.message);
    return;
  }
  std::string expected;
  ExecOptions exec;
  if (!ReadFile(td.input_file, exec.input) || !ReadFile(td.answer_file, expected)) {
    td.verdict = Verdict::EE;
    td.message = fmt::format("[{}] Failed to read test files", CaseName(td));
    return;
  }
  exec.command = {fs::absolute(BinaryPath(workspace)).string()};
  exec.workdir = workspace.string();
  exec.wall_time = opt.run_time;
  exec.max_output = opt.max_output;
  exec.cancel = opt.cancel;
  td.execute_result = Execute(exec);
  FinalizeCase(td, expected, opt);
}

void Summarize(VerificationResult& result) {
  result.verdict = Verdict::AC;
  std::string diagnostics;
  for (auto& td : result.case_results) {
    if ((int)result.verdict < (int)td.verdict) result.verdict = td.verdict;
    if (td.message.empty()) continue;
    if (!diagnostics.empty()) diagnostics += "\n\n";
    diagnostics += td.message;
  }
  result.diagnostics = std::move(diagnostics);
}

void Cancel(VerificationResult& result) {
  result.case_results.clear();
  result.diagnostics.clear();
  result.compile_message.clear();
  result.verdict = Verdict::CAN;
}

} // namespace

VerificationResult RunTests(const fs::path& solution_path, const VerifyOptions& opt) {
  VerificationResult result;
  auto Finish = [&]() {
    result.passed = result.verdict == Verdict::AC;
    spdlog::info("Verification finished: source={} verdict={} cases={}",
                 solution_path.c_str(), VerdictToAbr(result.verdict), result.case_results.size());
    if (opt.reporter.ReportFinished) opt.reporter.ReportFinished(result);
    return result;
  };

  if (!fs::is_regular_file(solution_path)) {
    result.verdict = Verdict::NF;
    result.diagnostics = "Source file not found: " + solution_path.string();
    return Finish();
  }
  const fs::path workspace = solution_path.has_parent_path() ? solution_path.parent_path() : fs::path(".");
  WorkspaceLock lock(workspace);
  if (lock.Error()) {
    result.verdict = Verdict::EE;
    result.diagnostics = fmt::format("Cannot lock workspace {}: {}",
                                     WorkspaceLockPath(workspace).string(), strerror(lock.Error()));
    return Finish();
  }
  if (!lock) {
    result.verdict = Verdict::BUSY;
    result.diagnostics = "Workspace is busy: another verification run holds " +
                         WorkspaceLockPath(workspace).string();
    return Finish();
  }

  if (!Compile(solution_path, workspace, opt, result)) {
    if (result.verdict == Verdict::CAN) Cancel(result);
    return Finish();
  }

  auto inputs = ListInputs(workspace);
  if (inputs.empty()) {
    result.verdict = Verdict::NT;
    result.diagnostics = "No .in test files found.";
    return Finish();
  }
  // every case is attempted; one broken case does not stop the others
  for (size_t i = 0; i < inputs.size(); i++) {
    if (IsCancelled(opt)) {
      Cancel(result);
      return Finish();
    }
    auto& td = result.case_results.emplace_back();
    td.input_file = inputs[i];
    td.answer_file = AnswerPathFor(inputs[i]);
    RunCase(td, workspace, opt);
    if (td.verdict == Verdict::CAN) {
      Cancel(result);
      return Finish();
    }
    if (opt.reporter.ReportCaseResult) opt.reporter.ReportCaseResult(result, i);
  }
  Summarize(result);
  return Finish();
}
