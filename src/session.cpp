#include "session.h"

#include <algorithm>
#include <stdexcept>

#include <spdlog/spdlog.h>
#include <trainer/paths.h>
#include <trainer/utils.h>
#include "workspace.h"

TrainingSession::TrainingSession(Database& db, const SampleStore& samples, Clock clock,
                                 VerifyOptions verify_opt, std::string solution_template) :
    db_(db), samples_(samples), clock_(std::move(clock)), ledger_(db, clock_),
    verify_opt_(std::move(verify_opt)),
    solution_template_(solution_template.empty() ? kDefaultSolutionTemplate : std::move(solution_template)) {}

Problem TrainingSession::GetProblem(long problem_id) {
  auto problem = db_.GetProblem(problem_id);
  if (!problem) throw std::invalid_argument("Unknown problem id " + std::to_string(problem_id));
  return *problem;
}

fs::path TrainingSession::Open(long problem_id) {
  Problem problem = GetProblem(problem_id);
  fs::path workspace = SetupWorkspace(problem.contest_id, problem_id, samples_, solution_template_);
  if (!WriteStartMarker(workspace, clock_())) {
    spdlog::warn("Attempt timer not started for problem {}", problem_id);
  }
  return workspace;
}

RunOutcome TrainingSession::Run(long problem_id) {
  Problem problem = GetProblem(problem_id);
  fs::path workspace = WorkspacePath(problem.contest_id, problem_id);
  if (!fs::is_directory(workspace)) workspace = Open(problem_id);
  auto started = ReadStartMarker(workspace);
  if (!started) {
    started = clock_();
    if (!WriteStartMarker(workspace, *started)) {
      spdlog::warn("Attempt timer not persisted for problem {}", problem_id);
    }
  }

  RunOutcome ret;
  ret.verification = RunTests(SolutionPath(workspace), verify_opt_);
  if (ret.verification.verdict == Verdict::CAN) {
    spdlog::info("Run cancelled: problem={}", problem_id);
    return ret;
  }
  auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(clock_() - *started).count();
  ret.attempt = ledger_.Record(problem_id,
                               ret.verification.passed ? AttemptOutcome::PASS : AttemptOutcome::FAIL,
                               std::max<int64_t>(1, elapsed));
  return ret;
}

ReviewUpdate TrainingSession::Rate(long problem_id, Rating rating) {
  GetProblem(problem_id);
  std::lock_guard lck(problem_lock[problem_id]);
  if (ledger_.LatestStatus(problem_id) != ProblemStatus::SOLVED) {
    throw std::invalid_argument("Problem " + std::to_string(problem_id) +
                                " cannot be rated: latest attempt is not a pass");
  }
  TimePoint now = clock_();
  ReviewState prior = InitialReviewState(now);
  double elapsed_days = 0.0;
  if (auto rec = db_.GetReviewState(problem_id)) {
    prior = ToReviewState(*rec);
    elapsed_days = ElapsedDays(prior.last_reviewed, now);
  }
  ReviewUpdate update = UpdateReview(prior, rating, elapsed_days, now);
  db_.PutReviewState(ToReviewRecord(problem_id, update.state));
  spdlog::info("Review committed: problem={} rating={} stability={:.3f} difficulty={:.2f} interval={}d",
               problem_id, RatingName(rating), update.state.stability, update.state.difficulty,
               update.interval_days);
  return update;
}

ProblemStatus TrainingSession::Status(long problem_id) {
  return ledger_.LatestStatus(problem_id);
}
