#ifndef INCLUDE_TRAINER_REVIEW_H_
#define INCLUDE_TRAINER_REVIEW_H_

#include <chrono>
#include <functional>

using TimePoint = std::chrono::system_clock::time_point;
using Clock = std::function<TimePoint()>;

// wall clock; tests pass their own
Clock SystemClock();

#define ENUM_RATING_ \
  X(AGAIN, 1, "again") \
  X(HARD, 2, "hard") \
  X(GOOD, 3, "good") \
  X(EASY, 4, "easy")
enum class Rating : int {
#define X(name, val, str) name = val,
  ENUM_RATING_
#undef X
};

constexpr double kMinStability = 0.1;
constexpr double kMinDifficulty = 1.0;
constexpr double kMaxDifficulty = 10.0;
constexpr double kInitialStability = 0.5;
constexpr double kInitialDifficulty = 5.0;
// upper bound of a scheduled interval
constexpr int kMaxIntervalDays = 36500;

struct ReviewState {
  double stability; // days
  double difficulty; // [1, 10]
  TimePoint last_reviewed;
  TimePoint next_review_due;
};

// how a successful recall moves the model; AGAIN has no entry
struct RatingPolicy {
  double difficulty_delta;
  double recall_bonus;
  double interval_multiplier;
};
const RatingPolicy& GetRatingPolicy(Rating);

struct ReviewUpdate {
  ReviewState state;
  int interval_days; // [1, kMaxIntervalDays]
  double retrievability; // before the review
};

// (1 + t / (9 * S))^-1; inputs are sanitized
double Retrievability(double stability, double elapsed_days);

// Synthetic prior for a problem that has never been rated; elapsed time is 0
ReviewState InitialReviewState(TimePoint now);

// fractional days, never negative
double ElapsedDays(TimePoint last_reviewed, TimePoint now);

// Pure: the result depends only on the arguments
ReviewUpdate UpdateReview(const ReviewState& prior, Rating rating, double elapsed_days, TimePoint now);

#endif  // INCLUDE_TRAINER_REVIEW_H_
