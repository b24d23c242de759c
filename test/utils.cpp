#include "utils.h"

TimePoint TestEpoch() {
  return TimePoint(std::chrono::seconds(1659916800));
}

TimePoint AtUtc(int days_from_epoch, int hour, int minute, int second) {
  return TestEpoch() + std::chrono::hours(24 * days_from_epoch + hour) +
      std::chrono::minutes(minute) + std::chrono::seconds(second);
}

long AddTestProblem(Database& db, const std::string& contest, const std::string& title) {
  return db.AddProblem({0, contest, title, "Read a, print a."});
}
