#include "database.h"

#include <spdlog/spdlog.h>

int64_t ToUnixMicros(TimePoint t) {
  return std::chrono::duration_cast<std::chrono::microseconds>(t.time_since_epoch()).count();
}

TimePoint FromUnixMicros(int64_t us) {
  return TimePoint(std::chrono::duration_cast<TimePoint::duration>(std::chrono::microseconds(us)));
}

ReviewState ToReviewState(const ReviewRecord& rec) {
  return {rec.stability, rec.difficulty, FromUnixMicros(rec.last_reviewed), FromUnixMicros(rec.next_review_due)};
}

ReviewRecord ToReviewRecord(long problem_id, const ReviewState& state) {
  return {problem_id, state.stability, state.difficulty,
          ToUnixMicros(state.last_reviewed), ToUnixMicros(state.next_review_due)};
}

void Database::Init() {
  if (db_) return;
  spdlog::debug("Open database {}", path_);
  // sync after construction: a moved-from in-memory storage does not keep its connection
  db_ = std::make_unique<Storage>(InitStorage(path_));
  db_->sync_schema(true);
}

long Database::AddProblem(const Problem& problem) {
  Init();
  return db_->insert(problem);
}

std::optional<Problem> Database::GetProblem(long id) {
  Init();
  if (auto ptr = db_->get_pointer<Problem>(id)) return *ptr;
  return std::nullopt;
}

void Database::DeleteProblem(long id) {
  Init();
  db_->remove<Problem>(id);
}

std::vector<std::string> Database::Contests() {
  using namespace sqlite_orm;
  Init();
  return db_->select(distinct(&Problem::contest_id), order_by(&Problem::contest_id));
}

std::vector<Problem> Database::ContestProblems(const std::string& contest_id) {
  using namespace sqlite_orm;
  Init();
  return db_->get_all<Problem>(where(c(&Problem::contest_id) == contest_id), order_by(&Problem::id));
}

long Database::AppendAttempt(const Attempt& attempt) {
  Init();
  return db_->insert(attempt);
}

std::optional<Attempt> Database::LatestAttempt(long problem_id) {
  using namespace sqlite_orm;
  Init();
  auto rows = db_->get_all<Attempt>(
      where(c(&Attempt::problem_id) == problem_id),
      multi_order_by(order_by(&Attempt::timestamp).desc(), order_by(&Attempt::id).desc()),
      limit(1));
  if (rows.empty()) return std::nullopt;
  return rows.front();
}

std::vector<Attempt> Database::Attempts(long problem_id) {
  using namespace sqlite_orm;
  Init();
  return db_->get_all<Attempt>(
      where(c(&Attempt::problem_id) == problem_id),
      multi_order_by(order_by(&Attempt::timestamp), order_by(&Attempt::id)));
}

std::optional<ReviewRecord> Database::GetReviewState(long problem_id) {
  Init();
  if (auto ptr = db_->get_pointer<ReviewRecord>(problem_id)) return *ptr;
  return std::nullopt;
}

void Database::PutReviewState(const ReviewRecord& rec) {
  Init();
  db_->replace(rec);
}

std::vector<ReviewRecord> Database::DueReviewStates(int64_t cutoff) {
  using namespace sqlite_orm;
  Init();
  return db_->get_all<ReviewRecord>(
      where(c(&ReviewRecord::next_review_due) <= cutoff),
      multi_order_by(order_by(&ReviewRecord::next_review_due), order_by(&ReviewRecord::problem_id)));
}
