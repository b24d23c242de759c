#include "ledger.h"

#include <stdexcept>

#include <spdlog/spdlog.h>

const char* StatusName(ProblemStatus status) {
  static const char* kNames[] = {
#define X(name, str) str,
    ENUM_PROBLEM_STATUS_
#undef X
  };
  return kNames[(int)status];
}

const char* OutcomeName(AttemptOutcome outcome) {
  static const char* kNames[] = {
#define X(name, str) str,
    ENUM_ATTEMPT_OUTCOME_
#undef X
  };
  return kNames[(int)outcome];
}

Attempt AttemptLedger::Record(long problem_id, AttemptOutcome outcome, int64_t duration) {
  if (duration < 1) {
    throw std::invalid_argument("attempt duration must be at least 1 second, got " + std::to_string(duration));
  }
  std::lock_guard lck(mtx_);
  Attempt attempt{0, problem_id, ToUnixMicros(clock_()), (int)outcome, duration};
  if (auto prev = db_.LatestAttempt(problem_id); prev && prev->timestamp >= attempt.timestamp) {
    attempt.timestamp = prev->timestamp + 1;
  }
  attempt.id = db_.AppendAttempt(attempt);
  spdlog::info("Attempt recorded: id={} problem={} outcome={} duration={}",
               attempt.id, problem_id, OutcomeName(outcome), duration);
  return attempt;
}

ProblemStatus AttemptLedger::LatestStatus(long problem_id) {
  auto latest = db_.LatestAttempt(problem_id);
  if (!latest) return ProblemStatus::UNSOLVED;
  return latest->Outcome() == AttemptOutcome::PASS ? ProblemStatus::SOLVED : ProblemStatus::ATTEMPTED;
}

std::vector<Attempt> AttemptLedger::History(long problem_id) {
  return db_.Attempts(problem_id);
}
