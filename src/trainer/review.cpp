#include <trainer/review.h>

#include <cmath>
#include <algorithm>
#include <stdexcept>

#include <spdlog/spdlog.h>
#include <trainer/utils.h>

namespace {

constexpr double kSecondsPerDay = 86'400.0;

// retrievability halves when elapsed = 9 * stability
constexpr double kDecayScale = 9.0;

// lapse: stability *= kLapseBase + kLapseSpan * r, i.e. a factor in [0.35, 0.60]
constexpr double kLapseBase = 0.35;
constexpr double kLapseSpan = 0.25;
constexpr double kLapsePenalty = 0.6;
constexpr int kLapseIntervalDays = 1;

constexpr double kGrowthRate = 0.04;

const RatingPolicy kHardPolicy = {0.15, 0.9, 1.3};
const RatingPolicy kGoodPolicy = {-0.10, 1.2, 2.4};
const RatingPolicy kEasyPolicy = {-0.30, 1.5, 3.2};

inline double SanitizeStability(double stability) {
  return std::max(stability, kMinStability);
}

inline double ClampDifficulty(double difficulty) {
  return std::clamp(difficulty, kMinDifficulty, kMaxDifficulty);
}

inline TimePoint AddDays(TimePoint t, int days) {
  return t + std::chrono::hours(24) * days;
}

} // namespace

Clock SystemClock() {
  return []() { return std::chrono::system_clock::now(); };
}

const RatingPolicy& GetRatingPolicy(Rating rating) {
  switch (rating) {
    case Rating::HARD: return kHardPolicy;
    case Rating::GOOD: return kGoodPolicy;
    case Rating::EASY: return kEasyPolicy;
    case Rating::AGAIN: break;
  }
  throw std::invalid_argument(std::string("no recall policy for rating ") + RatingName(rating));
}

double Retrievability(double stability, double elapsed_days) {
  double safe_days = std::max(elapsed_days, 0.0);
  return 1.0 / (1.0 + safe_days / (kDecayScale * SanitizeStability(stability)));
}

ReviewState InitialReviewState(TimePoint now) {
  return {kInitialStability, kInitialDifficulty, now, now};
}

double ElapsedDays(TimePoint last_reviewed, TimePoint now) {
  double seconds = std::chrono::duration<double>(now - last_reviewed).count();
  return std::max(0.0, seconds / kSecondsPerDay);
}

ReviewUpdate UpdateReview(const ReviewState& prior, Rating rating, double elapsed_days, TimePoint now) {
  const double stability = SanitizeStability(prior.stability);
  const double difficulty = ClampDifficulty(prior.difficulty);
  const double r = Retrievability(stability, elapsed_days);

  ReviewUpdate ret;
  ret.retrievability = r;
  if (rating == Rating::AGAIN) {
    ret.state.difficulty = ClampDifficulty(difficulty + kLapsePenalty * (1.0 - r));
    ret.state.stability = SanitizeStability(stability * (kLapseBase + kLapseSpan * r));
    ret.interval_days = kLapseIntervalDays;
  } else {
    const RatingPolicy& policy = GetRatingPolicy(rating);
    ret.state.difficulty = ClampDifficulty(difficulty + policy.difficulty_delta);
    double growth = 1.0 + (11.0 - ret.state.difficulty) * kGrowthRate * (1.0 - r) * policy.recall_bonus;
    ret.state.stability = SanitizeStability(stability * growth);
    // clamp in floating point; the product may not fit an integer
    double days = std::round(ret.state.stability * policy.interval_multiplier);
    ret.interval_days = (int)std::clamp(days, 1.0, (double)kMaxIntervalDays);
  }
  ret.state.last_reviewed = now;
  ret.state.next_review_due = AddDays(now, ret.interval_days);
  spdlog::debug("Review update: rating={} elapsed={:.3f} r={:.4f} stability {:.3f}->{:.3f} "
                "difficulty {:.2f}->{:.2f} interval={}d",
                RatingName(rating), elapsed_days, r, stability, ret.state.stability,
                difficulty, ret.state.difficulty, ret.interval_days);
  return ret;
}
