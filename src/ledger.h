#ifndef LEDGER_H_
#define LEDGER_H_

#include <mutex>
#include <vector>

#include "database.h"

#define ENUM_PROBLEM_STATUS_ \
  X(UNSOLVED, "unsolved") \
  X(ATTEMPTED, "attempted") \
  X(SOLVED, "solved")
enum class ProblemStatus {
#define X(name, str) name,
  ENUM_PROBLEM_STATUS_
#undef X
};

const char* StatusName(ProblemStatus);
const char* OutcomeName(AttemptOutcome);

// Append-only record of verification runs
class AttemptLedger {
  Database& db_;
  Clock clock_;
  std::mutex mtx_;
 public:
  explicit AttemptLedger(Database& db, Clock clock = SystemClock()) :
      db_(db), clock_(std::move(clock)) {}

  // duration in seconds, must be positive
  Attempt Record(long problem_id, AttemptOutcome outcome, int64_t duration);
  ProblemStatus LatestStatus(long problem_id);
  // oldest first
  std::vector<Attempt> History(long problem_id);
};

#endif  // LEDGER_H_
