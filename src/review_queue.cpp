#include "review_queue.h"

#include <spdlog/spdlog.h>

namespace {

using Days = std::chrono::duration<int64_t, std::ratio<86400>>;

} // namespace

TimePoint EndOfDay(TimePoint as_of) {
  auto day = std::chrono::floor<Days>(as_of);
  return day + Days(1) - std::chrono::microseconds(1);
}

std::vector<DueReview> DueProblems(Database& db, TimePoint as_of) {
  std::vector<DueReview> ret;
  for (auto& rec : db.DueReviewStates(ToUnixMicros(EndOfDay(as_of)))) {
    auto problem = db.GetProblem(rec.problem_id);
    // cascade deletes keep this from happening short of a foreign database
    if (!problem) {
      spdlog::warn("Review state without problem: problem={}", rec.problem_id);
      continue;
    }
    ret.push_back({std::move(*problem), ToReviewState(rec)});
  }
  spdlog::debug("Due problems: count={}", ret.size());
  return ret;
}
