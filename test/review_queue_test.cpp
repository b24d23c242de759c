#include <gtest/gtest.h>

#include "database.h"
#include "review_queue.h"
#include "utils.h"

namespace {

void PutDue(Database& db, long id, TimePoint due) {
  db.PutReviewState(ToReviewRecord(id, {1.0, 5.0, due - std::chrono::hours(24), due}));
}

} // namespace

TEST(EndOfDay, LastInstantOfUtcDay) {
  EXPECT_EQ(EndOfDay(AtUtc(3, 0, 0)), AtUtc(4, 0, 0) - std::chrono::microseconds(1));
  EXPECT_EQ(EndOfDay(AtUtc(3, 23, 59, 59)), AtUtc(4, 0, 0) - std::chrono::microseconds(1));
  EXPECT_EQ(EndOfDay(AtUtc(3, 12, 0)), EndOfDay(AtUtc(3, 1, 0)));
}

TEST(DueProblems, YesterdayButNotTomorrow) {
  Database db(":memory:");
  long p = AddTestProblem(db, "c", "P");
  long q = AddTestProblem(db, "c", "Q");
  // "today" is day 5
  PutDue(db, p, AtUtc(4, 23, 59));
  PutDue(db, q, AtUtc(6, 0, 1));
  auto due = DueProblems(db, AtUtc(5, 9, 0));
  ASSERT_EQ(due.size(), 1);
  EXPECT_EQ(due[0].problem.id, p);
  EXPECT_EQ(due[0].problem.title, "P");
  EXPECT_EQ(due[0].state.next_review_due, AtUtc(4, 23, 59));
}

TEST(DueProblems, WholeDayCounts) {
  Database db(":memory:");
  long p = AddTestProblem(db, "c", "P");
  PutDue(db, p, AtUtc(5, 23, 59, 59));
  EXPECT_EQ(DueProblems(db, AtUtc(5, 0, 0)).size(), 1);
  EXPECT_TRUE(DueProblems(db, AtUtc(4, 23, 59)).empty());
}

TEST(DueProblems, OrderedByDueDateThenId) {
  Database db(":memory:");
  long a = AddTestProblem(db, "c", "A");
  long b = AddTestProblem(db, "c", "B");
  long c = AddTestProblem(db, "c", "C");
  long d = AddTestProblem(db, "c", "D");
  AddTestProblem(db, "c", "never rated");
  PutDue(db, a, AtUtc(3, 0, 0));
  PutDue(db, b, AtUtc(1, 0, 0));
  PutDue(db, c, AtUtc(3, 0, 0));
  PutDue(db, d, AtUtc(2, 0, 0));
  auto due = DueProblems(db, AtUtc(3, 0, 0));
  std::vector<long> ids;
  for (auto& i : due) ids.push_back(i.problem.id);
  EXPECT_EQ(ids, (std::vector<long>{b, d, a, c}));
}

TEST(DueProblems, Empty) {
  Database db(":memory:");
  EXPECT_TRUE(DueProblems(db, AtUtc(0, 0, 0)).empty());
}
