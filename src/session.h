#ifndef SESSION_H_
#define SESSION_H_

#include <optional>

#include <trainer/verifier.h>
#include <trainer/review.h>
#include "database.h"
#include "ledger.h"
#include "samples.h"

struct RunOutcome {
  VerificationResult verification;
  std::optional<Attempt> attempt; // empty if the run was cancelled
};

// open -> run -> rate, one problem at a time
class TrainingSession {
  Database& db_;
  const SampleStore& samples_;
  Clock clock_;
  AttemptLedger ledger_;
  VerifyOptions verify_opt_;
  std::string solution_template_;

  Problem GetProblem(long problem_id);
 public:
  TrainingSession(Database& db, const SampleStore& samples, Clock clock = SystemClock(),
                  VerifyOptions verify_opt = VerifyOptions(),
                  std::string solution_template = "");

  // returns the workspace directory; (re)starts the attempt timer
  fs::path Open(long problem_id);
  // verify the workspace's solution and record the attempt
  RunOutcome Run(long problem_id);
  // commit a review; throws std::invalid_argument unless the latest attempt passed
  ReviewUpdate Rate(long problem_id, Rating rating);
  ProblemStatus Status(long problem_id);

  AttemptLedger& Ledger() { return ledger_; }
  VerifyOptions& Options() { return verify_opt_; }
};

#endif  // SESSION_H_
