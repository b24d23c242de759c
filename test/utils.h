#ifndef TEST_UTILS_H_
#define TEST_UTILS_H_

#include <vector>
#include <string>

#include <gtest/gtest.h>
#include <trainer/utils.h>
#include <trainer/verifier.h>
#include "database.h"

class AssertVerdictReporter {
  bool has_compile_result_;
  bool has_overall_result_;
  bool require_cases_;

  void AssertResult_() {
    ASSERT_TRUE(has_overall_result_);
    if (require_cases_) ASSERT_FALSE(case_names.empty());
  }
 public:
  Verdict expect_verdict;
  // input file names in the order they were reported
  std::vector<std::string> case_names;

  AssertVerdictReporter(Verdict ver, bool require_cases = true) :
      has_compile_result_(false),
      has_overall_result_(false),
      require_cases_(require_cases),
      expect_verdict(ver) {}
  ~AssertVerdictReporter() { AssertResult_(); }

  void ReportOverallResult(const VerificationResult& res) {
    ASSERT_EQ(res.verdict, expect_verdict) << res.diagnostics;
    ASSERT_EQ(res.passed, expect_verdict == Verdict::AC);
    has_overall_result_ = true;
  }
  void ReportCaseResult(const VerificationResult& res, size_t idx) {
    ASSERT_TRUE(has_compile_result_);
    ASSERT_LT(idx, res.case_results.size());
    case_names.push_back(res.case_results[idx].input_file.filename().string());
  }

  VerifyOptions::Reporter GetReporter() {
    VerifyOptions::Reporter reporter;
    reporter.ReportCompileResult = [&](const VerificationResult&) {
      has_compile_result_ = true;
    };
    reporter.ReportCaseResult = [&](const VerificationResult& res, size_t idx) {
      ReportCaseResult(res, idx);
    };
    reporter.ReportFinished = [&](const VerificationResult& res) {
      ReportOverallResult(res);
    };
    return reporter;
  }
};

// fixed instant that tests can move
class FakeClock {
  TimePoint now_;
 public:
  explicit FakeClock(TimePoint start) : now_(start) {}
  void Advance(std::chrono::system_clock::duration d) { now_ += d; }
  void Set(TimePoint t) { now_ = t; }
  TimePoint Now() const { return now_; }
  Clock GetClock() { return [this]() { return now_; }; }
};

// 2022-08-08T00:00:00Z
TimePoint TestEpoch();
TimePoint AtUtc(int days_from_epoch, int hour, int minute, int second = 0);

long AddTestProblem(Database& db, const std::string& contest, const std::string& title);

#endif // TEST_UTILS_H_
