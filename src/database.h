#ifndef DATABASE_H_
#define DATABASE_H_

#include <memory>
#include <string>
#include <vector>
#include <optional>

#include <sqlite_orm/sqlite_orm.h>
#include <trainer/review.h>

struct Problem {
  long id;
  std::string contest_id;
  std::string title;
  std::string body;
};

#define ENUM_ATTEMPT_OUTCOME_ \
  X(PASS, "Pass") \
  X(FAIL, "Fail")
enum class AttemptOutcome : int {
#define X(name, str) name,
  ENUM_ATTEMPT_OUTCOME_
#undef X
};

// timestamps are UNIX microseconds
struct Attempt {
  long id;
  long problem_id;
  int64_t timestamp;
  int outcome; // AttemptOutcome
  int64_t duration; // seconds, >= 1

  AttemptOutcome Outcome() const { return (AttemptOutcome)outcome; }
};

struct ReviewRecord {
  long problem_id;
  double stability;
  double difficulty;
  int64_t last_reviewed;
  int64_t next_review_due;
};

int64_t ToUnixMicros(TimePoint);
TimePoint FromUnixMicros(int64_t);
ReviewState ToReviewState(const ReviewRecord&);
ReviewRecord ToReviewRecord(long problem_id, const ReviewState&);

namespace {

inline auto InitStorage(const std::string& path) {
  using namespace sqlite_orm;
  return make_storage(path,
      make_index("idx_problems_contest", &Problem::contest_id),
      make_index("idx_attempts_problem_timestamp", &Attempt::problem_id, &Attempt::timestamp),
      make_index("idx_review_states_due", &ReviewRecord::next_review_due),
      make_table("problems",
                 make_column("id", &Problem::id, primary_key()),
                 make_column("contest_id", &Problem::contest_id),
                 make_column("title", &Problem::title),
                 make_column("body", &Problem::body, default_value(""))),
      make_table("attempts",
                 make_column("id", &Attempt::id, primary_key()),
                 make_column("problem_id", &Attempt::problem_id),
                 make_column("timestamp", &Attempt::timestamp),
                 make_column("outcome", &Attempt::outcome),
                 make_column("duration", &Attempt::duration),
                 foreign_key(&Attempt::problem_id).references(&Problem::id).on_delete.cascade()),
      make_table("review_states",
                 make_column("problem_id", &ReviewRecord::problem_id, primary_key()),
                 make_column("stability", &ReviewRecord::stability),
                 make_column("difficulty", &ReviewRecord::difficulty),
                 make_column("last_reviewed", &ReviewRecord::last_reviewed),
                 make_column("next_review_due", &ReviewRecord::next_review_due),
                 foreign_key(&ReviewRecord::problem_id).references(&Problem::id).on_delete.cascade()));
}

} // namespace

// Storage errors surface as std::system_error from sqlite_orm
class Database {
 public:
  using Storage = decltype(InitStorage(""));

 private:
  std::string path_;
  std::unique_ptr<Storage> db_;

 public:
  // ":memory:" keeps everything in this object
  explicit Database(std::string path) : path_(std::move(path)) {}

  void Init();

  long AddProblem(const Problem&);
  std::optional<Problem> GetProblem(long id);
  // attempts and review state go with it
  void DeleteProblem(long id);
  std::vector<std::string> Contests();
  std::vector<Problem> ContestProblems(const std::string& contest_id);

  long AppendAttempt(const Attempt&);
  std::optional<Attempt> LatestAttempt(long problem_id);
  std::vector<Attempt> Attempts(long problem_id);

  std::optional<ReviewRecord> GetReviewState(long problem_id);
  void PutReviewState(const ReviewRecord&);
  // next_review_due <= cutoff, soonest first, ties by problem id
  std::vector<ReviewRecord> DueReviewStates(int64_t cutoff);
};

#endif  // DATABASE_H_
