#include <stdexcept>

#include <gtest/gtest.h>
#include <trainer/review.h>
#include <trainer/utils.h>

#include "utils.h"

namespace {

constexpr Rating kAllRatings[] = {Rating::AGAIN, Rating::HARD, Rating::GOOD, Rating::EASY};
constexpr double kStabilities[] = {-3.0, 0.0, 0.05, 0.1, 0.5, 1.0, 7.5, 42.0, 365.0, 1e5};
constexpr double kDifficulties[] = {-1.0, 1.0, 1.1, 5.0, 9.95, 10.0, 25.0};
constexpr double kElapsed[] = {-2.0, 0.0, 0.25, 1.0, 3.0, 30.0, 1000.0};

int IntervalDays(const ReviewState& state) {
  auto diff = state.next_review_due - state.last_reviewed;
  return std::chrono::duration_cast<std::chrono::hours>(diff).count() / 24;
}

} // namespace

TEST(Retrievability, DecayCurve) {
  EXPECT_DOUBLE_EQ(Retrievability(3.0, 0.0), 1.0);
  EXPECT_DOUBLE_EQ(Retrievability(1.0, 9.0), 0.5);
  EXPECT_DOUBLE_EQ(Retrievability(2.0, -5.0), 1.0);
  // stability is floored at 0.1
  EXPECT_DOUBLE_EQ(Retrievability(0.0, 0.9), 0.5);
  EXPECT_GT(Retrievability(1.0, 1e6), 0.0);
  EXPECT_GT(Retrievability(1.0, 1.0), Retrievability(1.0, 2.0));
}

TEST(RatingPolicy, Table) {
  auto& hard = GetRatingPolicy(Rating::HARD);
  EXPECT_DOUBLE_EQ(hard.difficulty_delta, 0.15);
  EXPECT_DOUBLE_EQ(hard.recall_bonus, 0.9);
  EXPECT_DOUBLE_EQ(hard.interval_multiplier, 1.3);
  auto& good = GetRatingPolicy(Rating::GOOD);
  EXPECT_DOUBLE_EQ(good.difficulty_delta, -0.10);
  EXPECT_DOUBLE_EQ(good.recall_bonus, 1.2);
  EXPECT_DOUBLE_EQ(good.interval_multiplier, 2.4);
  auto& easy = GetRatingPolicy(Rating::EASY);
  EXPECT_DOUBLE_EQ(easy.difficulty_delta, -0.30);
  EXPECT_DOUBLE_EQ(easy.recall_bonus, 1.5);
  EXPECT_DOUBLE_EQ(easy.interval_multiplier, 3.2);
  EXPECT_THROW(GetRatingPolicy(Rating::AGAIN), std::invalid_argument);
}

TEST(ReviewModel, InitialState) {
  auto state = InitialReviewState(TestEpoch());
  EXPECT_DOUBLE_EQ(state.stability, 0.5);
  EXPECT_DOUBLE_EQ(state.difficulty, 5.0);
  EXPECT_EQ(state.last_reviewed, TestEpoch());
}

TEST(ReviewModel, ElapsedDays) {
  EXPECT_DOUBLE_EQ(ElapsedDays(TestEpoch(), AtUtc(1, 12, 0)), 1.5);
  EXPECT_DOUBLE_EQ(ElapsedDays(AtUtc(3, 0, 0), TestEpoch()), 0.0);
}

TEST(ReviewModel, AgainAlwaysOneDay) {
  for (double s : kStabilities) {
    for (double d : kDifficulties) {
      for (double t : kElapsed) {
        auto update = UpdateReview({s, d, TestEpoch(), TestEpoch()}, Rating::AGAIN, t, AtUtc(2, 8, 30));
        EXPECT_EQ(update.interval_days, 1) << s << ' ' << d << ' ' << t;
        EXPECT_EQ(update.state.next_review_due, AtUtc(3, 8, 30));
      }
    }
  }
}

TEST(ReviewModel, ClampsHoldAfterUpdate) {
  for (Rating rating : kAllRatings) {
    for (double s : kStabilities) {
      for (double d : kDifficulties) {
        for (double t : kElapsed) {
          auto update = UpdateReview({s, d, TestEpoch(), TestEpoch()}, rating, t, TestEpoch());
          EXPECT_GE(update.state.difficulty, 1.0);
          EXPECT_LE(update.state.difficulty, 10.0);
          EXPECT_GE(update.state.stability, 0.1);
          EXPECT_GE(update.interval_days, 1);
          EXPECT_EQ(IntervalDays(update.state), update.interval_days);
          EXPECT_GE(update.state.next_review_due, update.state.last_reviewed);
        }
      }
    }
  }
}

TEST(ReviewModel, IntervalIsBounded) {
  for (double s : {1e5, 1e9, 1e15, 1e300}) {
    for (Rating rating : {Rating::HARD, Rating::GOOD, Rating::EASY}) {
      auto update = UpdateReview({s, 1.0, TestEpoch(), TestEpoch()}, rating, 1000.0, TestEpoch());
      EXPECT_EQ(update.interval_days, kMaxIntervalDays) << s;
      EXPECT_EQ(IntervalDays(update.state), update.interval_days) << s;
      EXPECT_GE(update.state.next_review_due, update.state.last_reviewed) << s;
    }
  }
}

TEST(ReviewModel, LapsePenaltyGrowsWithElapsedTime) {
  for (double s : kStabilities) {
    double prev_penalty = -1.0;
    for (double t : {0.0, 0.5, 1.0, 2.0, 5.0, 10.0, 100.0, 1000.0}) {
      auto update = UpdateReview({s, 2.0, TestEpoch(), TestEpoch()}, Rating::AGAIN, t, TestEpoch());
      double penalty = update.state.difficulty - 2.0;
      EXPECT_GE(penalty, prev_penalty) << s << ' ' << t;
      prev_penalty = penalty;
    }
  }
}

TEST(ReviewModel, LapseValues) {
  // r = 0.9
  auto update = UpdateReview({10.0, 5.0, TestEpoch(), TestEpoch()}, Rating::AGAIN, 10.0, TestEpoch());
  EXPECT_NEAR(update.retrievability, 0.9, 1e-12);
  EXPECT_NEAR(update.state.difficulty, 5.06, 1e-12);
  EXPECT_NEAR(update.state.stability, 5.75, 1e-12);
}

TEST(ReviewModel, FirstGoodReview) {
  TimePoint t0 = TestEpoch();
  TimePoint now = AtUtc(1, 0, 0);
  ReviewState prior = InitialReviewState(t0);
  auto update = UpdateReview(prior, Rating::GOOD, 1.0, now);
  EXPECT_NEAR(update.state.difficulty, 4.9, 1e-12);
  EXPECT_GT(update.state.stability, 0.5);
  int expected_interval = std::max(1, (int)std::lround(update.state.stability * 2.4));
  EXPECT_EQ(update.interval_days, expected_interval);
  EXPECT_EQ(update.state.last_reviewed, now);
  EXPECT_EQ(update.state.next_review_due, now + std::chrono::hours(24) * expected_interval);
}

TEST(ReviewModel, RecallValues) {
  // r = 0.9; growth = 1 + 6.1 * 0.04 * 0.1 * 1.2
  auto update = UpdateReview({10.0, 5.0, TestEpoch(), TestEpoch()}, Rating::GOOD, 10.0, TestEpoch());
  EXPECT_NEAR(update.state.difficulty, 4.9, 1e-12);
  EXPECT_NEAR(update.state.stability, 10.2928, 1e-9);
  EXPECT_EQ(update.interval_days, 25);
}

TEST(ReviewModel, EasierRatingsGrowFaster) {
  ReviewState prior{4.0, 6.0, TestEpoch(), TestEpoch()};
  auto hard = UpdateReview(prior, Rating::HARD, 6.0, AtUtc(6, 0, 0));
  auto good = UpdateReview(prior, Rating::GOOD, 6.0, AtUtc(6, 0, 0));
  auto easy = UpdateReview(prior, Rating::EASY, 6.0, AtUtc(6, 0, 0));
  EXPECT_LT(hard.state.stability, good.state.stability);
  EXPECT_LT(good.state.stability, easy.state.stability);
  EXPECT_LE(hard.interval_days, good.interval_days);
  EXPECT_LE(good.interval_days, easy.interval_days);
  EXPECT_GT(hard.state.difficulty, prior.difficulty);
  EXPECT_LT(easy.state.difficulty, good.state.difficulty);
}

TEST(ReviewModel, Deterministic) {
  ReviewState prior{3.3, 7.1, TestEpoch(), TestEpoch()};
  auto a = UpdateReview(prior, Rating::HARD, 2.5, AtUtc(2, 12, 0));
  auto b = UpdateReview(prior, Rating::HARD, 2.5, AtUtc(2, 12, 0));
  EXPECT_EQ(a.state.stability, b.state.stability);
  EXPECT_EQ(a.state.difficulty, b.state.difficulty);
  EXPECT_EQ(a.state.next_review_due, b.state.next_review_due);
}

TEST(Rating, Parse) {
  EXPECT_EQ(ParseRating("1"), Rating::AGAIN);
  EXPECT_EQ(ParseRating("hard"), Rating::HARD);
  EXPECT_EQ(ParseRating("Good"), Rating::GOOD);
  EXPECT_EQ(ParseRating("4"), Rating::EASY);
  EXPECT_FALSE(ParseRating("0"));
  EXPECT_FALSE(ParseRating("5"));
  EXPECT_FALSE(ParseRating(""));
  EXPECT_STREQ(RatingName(Rating::EASY), "easy");
}
