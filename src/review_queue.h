#ifndef REVIEW_QUEUE_H_
#define REVIEW_QUEUE_H_

#include <vector>

#include "database.h"

struct DueReview {
  Problem problem;
  ReviewState state;
};

// last representable instant of as_of's UTC calendar day
TimePoint EndOfDay(TimePoint as_of);

// problems due by the end of as_of's day, soonest first, ties by problem id
std::vector<DueReview> DueProblems(Database& db, TimePoint as_of);

#endif  // REVIEW_QUEUE_H_
