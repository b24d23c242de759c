#ifndef INCLUDE_TRAINER_VERIFIER_H_
#define INCLUDE_TRAINER_VERIFIER_H_

#include <atomic>
#include <string>
#include <vector>
#include <filesystem>
#include <functional>

#include "process.h"

extern std::string kCompiler;
extern std::vector<std::string> kCompileFlags;
// us
extern long kCompileTimeUs;
extern long kRunTimeUs;
// KiB
extern long kMaxOutput;

// the max of every test case would be the final result
#define ENUM_VERDICT_ \
  X(NUL, "", "nil") \
  /* verdicts after execution */ \
  X(AC, "AC", "Accepted") \
  X(WA, "WA", "Wrong Answer") \
  X(TLE, "TLE", "Time Limit Exceeded") \
  X(OLE, "OLE", "Output Limit Exceeded") \
  X(RE, "RE", "Runtime Error (exited with nonzero status)") \
  X(SIG, "SIG", "Runtime Error (exited with signal)") \
  X(EE, "EE", "Execution Error") \
  X(MF, "MF", "Missing Expected Output") \
  /* verdicts before any test case runs */ \
  X(CE, "CE", "Compile Error") \
  X(CLE, "CLE", "Compilation Limit Exceeded") \
  X(NT, "NT", "No Test Inputs") \
  X(NF, "NF", "Solution Not Found") \
  X(BUSY, "BUSY", "Workspace Busy") \
  X(CAN, "CAN", "Cancelled")
enum class Verdict {
#define X(name, abr, desc) name,
  ENUM_VERDICT_
#undef X
};

class VerificationResult {
 public:
  struct CaseResult {
    std::filesystem::path input_file, answer_file;
    ExecResult execute_result;
    Verdict verdict;
    std::string message; // diagnostic block; empty iff AC
    CaseResult() : verdict(Verdict::NUL) {}
  };
  std::vector<CaseResult> case_results;
  // overall result
  Verdict verdict;
  bool passed;
  std::string compile_message;
  std::string diagnostics;

  VerificationResult() : verdict(Verdict::NUL), passed(false) {}
};

class VerifyOptions {
 public:
  std::string compiler;
  std::vector<std::string> compile_flags;
  long compile_time; // us
  long run_time; // us, per test case
  long max_output; // KiB, per test case
  // checked while waiting for a child; setting it kills the child and discards the run
  const std::atomic_bool* cancel;

  struct Reporter {
    // these functions should not block
    std::function<void(const std::filesystem::path& solution)> ReportStartCompiling;
    std::function<void(const VerificationResult&)> ReportCompileResult;
    std::function<void(const VerificationResult&, size_t case_index)> ReportCaseResult;
    std::function<void(const VerificationResult&)> ReportFinished;
  };
  Reporter reporter;

  VerifyOptions() :
      compiler(kCompiler),
      compile_flags(kCompileFlags),
      compile_time(kCompileTimeUs),
      run_time(kRunTimeUs),
      max_output(kMaxOutput),
      cancel(nullptr) {}
};

// Compile the solution next to its test files, run it against every *.in in the
// solution's directory (file name order) and compare with the matching *.out.
// Never throws for solution or fixture defects; they are reported in the result.
VerificationResult RunTests(const std::filesystem::path& solution_path,
                            const VerifyOptions& opt = VerifyOptions());

#endif  // INCLUDE_TRAINER_VERIFIER_H_
