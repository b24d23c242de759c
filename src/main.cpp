#include <ctime>
#include <iostream>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <filesystem>

#include <tortellini.hh>
#include <spdlog/spdlog.h>
#include <argparse/argparse.hpp>
#include <trainer/logger.h>
#include <trainer/paths.h>
#include <trainer/process.h>
#include <trainer/utils.h>
#include "paths.h"
#include "database.h"
#include "review_queue.h"
#include "session.h"
#include "workspace.h"

namespace {

std::vector<std::string> SplitFlags(const std::string& str) {
  std::vector<std::string> ret;
  std::istringstream sin(str);
  for (std::string flag; sin >> flag;) ret.push_back(flag);
  return ret;
}

bool ParseConfig(const fs::path& conf_path) {
  std::ifstream fin(conf_path);
  if (!fin) return false;
  tortellini::ini ini;
  fin >> ini;
  std::string workspace_root = ini[""]["workspace_root"] | "";
  std::string database = ini[""]["database"] | "";
  std::string samples_cache = ini[""]["samples_cache"] | "";
  std::string solution_template = ini[""]["solution_template"] | "";
  std::string compile_flags = ini[""]["compile_flags"] | "";
  if (workspace_root.size()) kWorkspaceRoot = workspace_root;
  if (database.size()) kDatabasePath = database;
  if (samples_cache.size()) kSamplesCachePath = samples_cache;
  if (solution_template.size()) kSolutionTemplatePath = solution_template;
  if (compile_flags.size()) kCompileFlags = SplitFlags(compile_flags);
  kCompiler = ini[""]["compiler"] | kCompiler;
  kCompileTimeUs = (ini[""]["compile_timeout_ms"] | (kCompileTimeUs / 1000)) * 1000;
  kRunTimeUs = (ini[""]["run_timeout_ms"] | (kRunTimeUs / 1000)) * 1000;
  kMaxOutput = ini[""]["max_output_kib"] | kMaxOutput;
  return true;
}

std::string FormatDate(TimePoint t) {
  std::time_t tt = std::chrono::system_clock::to_time_t(t);
  std::tm tm{};
  gmtime_r(&tt, &tm);
  std::ostringstream sout;
  sout << std::put_time(&tm, "%Y-%m-%d");
  return sout.str();
}

TimePoint ParseDate(const std::string& str) {
  std::tm tm{};
  std::istringstream sin(str);
  sin >> std::get_time(&tm, "%Y-%m-%d");
  if (sin.fail()) throw std::invalid_argument("Invalid date " + str + " (expected YYYY-MM-DD)");
  return std::chrono::system_clock::from_time_t(timegm(&tm));
}

Rating GetRating(const std::string& str) {
  auto rating = ParseRating(str);
  if (!rating) throw std::invalid_argument("Invalid rating " + str + " (1-4 or again/hard/good/easy)");
  return *rating;
}

void PrintVerification(const VerificationResult& res) {
  std::cout << (res.passed ? "Tests passed" : "Tests failed") << " ["
            << VerdictToAbr(res.verdict) << "] " << VerdictToDesc(res.verdict) << '\n';
  if (res.diagnostics.size()) std::cout << '\n' << res.diagnostics << '\n';
}

VerifyOptions CliVerifyOptions() {
  VerifyOptions opt;
  opt.reporter.ReportStartCompiling = [](const fs::path& solution) {
    std::cerr << "Compiling " << solution.string() << "...\n";
  };
  opt.reporter.ReportCaseResult = [](const VerificationResult& res, size_t idx) {
    auto& td = res.case_results[idx];
    std::cerr << td.input_file.filename().string() << ": " << VerdictToAbr(td.verdict) << '\n';
  };
  return opt;
}

struct Commands {
  argparse::ArgumentParser import_cmd{"import"};
  argparse::ArgumentParser contests_cmd{"contests"};
  argparse::ArgumentParser problems_cmd{"problems"};
  argparse::ArgumentParser open_cmd{"open"};
  argparse::ArgumentParser run_cmd{"run"};
  argparse::ArgumentParser rate_cmd{"rate"};
  argparse::ArgumentParser due_cmd{"due"};
  argparse::ArgumentParser status_cmd{"status"};
  argparse::ArgumentParser delete_cmd{"delete"};

  Commands() {
    import_cmd.add_description("Import a contest JSON file (problems and samples)");
    import_cmd.add_argument("file");
    contests_cmd.add_description("List contests");
    problems_cmd.add_description("List problems of a contest with their status");
    problems_cmd.add_argument("contest");
    open_cmd.add_description("Set up the workspace of a problem and start its timer");
    open_cmd.add_argument("id").scan<'d', long>();
    run_cmd.add_description("Compile and test the solution, recording an attempt");
    run_cmd.add_argument("id").scan<'d', long>();
    run_cmd.add_argument("-r", "--rating")
      .help("Rate the recall right away if the tests pass (1-4 or again/hard/good/easy)");
    rate_cmd.add_description("Rate the recall of a solved problem");
    rate_cmd.add_argument("id").scan<'d', long>();
    rate_cmd.add_argument("rating");
    due_cmd.add_description("List problems due for review");
    due_cmd.add_argument("-d", "--date").help("YYYY-MM-DD (UTC); defaults to today");
    status_cmd.add_description("Show the status and attempts of a problem");
    status_cmd.add_argument("id").scan<'d', long>();
    delete_cmd.add_description("Delete a problem with its attempts and review state");
    delete_cmd.add_argument("id").scan<'d', long>();
  }
};

int Dispatch(argparse::ArgumentParser& parser, Commands& cmd) {
  Database db(kDatabasePath.string());
  if (parser.is_subcommand_used(cmd.import_cmd)) {
    SampleStore samples(kSamplesCachePath);
    auto ids = ImportContest(cmd.import_cmd.get<std::string>("file"), db, samples);
    std::cout << "Imported " << ids.size() << " problems\n";
    return 0;
  }
  if (parser.is_subcommand_used(cmd.contests_cmd)) {
    for (auto& contest : db.Contests()) std::cout << contest << '\n';
    return 0;
  }
  if (parser.is_subcommand_used(cmd.delete_cmd)) {
    long id = cmd.delete_cmd.get<long>("id");
    if (!db.GetProblem(id)) throw std::invalid_argument("Unknown problem id " + std::to_string(id));
    db.DeleteProblem(id);
    spdlog::info("Deleted problem {}", id);
    return 0;
  }
  if (parser.is_subcommand_used(cmd.due_cmd)) {
    TimePoint as_of = std::chrono::system_clock::now();
    if (auto date = cmd.due_cmd.present("--date")) as_of = ParseDate(*date);
    for (auto& item : DueProblems(db, as_of)) {
      std::cout << item.problem.id << '\t' << item.problem.contest_id << '\t' << item.problem.title
                << "\tdue " << FormatDate(item.state.next_review_due) << '\n';
    }
    return 0;
  }

  SampleStore samples(kSamplesCachePath);
  TrainingSession session(db, samples, SystemClock(), CliVerifyOptions(),
                          LoadSolutionTemplate(kSolutionTemplatePath));
  if (parser.is_subcommand_used(cmd.problems_cmd)) {
    for (auto& problem : db.ContestProblems(cmd.problems_cmd.get<std::string>("contest"))) {
      std::cout << problem.id << '\t' << StatusName(session.Status(problem.id))
                << '\t' << problem.title << '\n';
    }
    return 0;
  }
  if (parser.is_subcommand_used(cmd.open_cmd)) {
    std::cout << SolutionPath(session.Open(cmd.open_cmd.get<long>("id"))).string() << '\n';
    return 0;
  }
  if (parser.is_subcommand_used(cmd.run_cmd)) {
    long id = cmd.run_cmd.get<long>("id");
    std::optional<Rating> rating;
    // validate before spending time on the run
    if (auto str = cmd.run_cmd.present("--rating")) rating = GetRating(*str);
    // Ctrl-C kills the compiler or solution instead of orphaning it
    session.Options().cancel = CancelOnSignals();
    RunOutcome outcome = session.Run(id);
    PrintVerification(outcome.verification);
    if (outcome.verification.verdict == Verdict::CAN) return 1;
    if (rating && outcome.verification.passed) {
      auto update = session.Rate(id, *rating);
      std::cout << "Next review in " << update.interval_days << " day(s), on "
                << FormatDate(update.state.next_review_due) << '\n';
    }
    return 0;
  }
  if (parser.is_subcommand_used(cmd.rate_cmd)) {
    auto update = session.Rate(cmd.rate_cmd.get<long>("id"), GetRating(cmd.rate_cmd.get<std::string>("rating")));
    std::cout << "Next review in " << update.interval_days << " day(s), on "
              << FormatDate(update.state.next_review_due) << '\n';
    return 0;
  }
  if (parser.is_subcommand_used(cmd.status_cmd)) {
    long id = cmd.status_cmd.get<long>("id");
    if (!db.GetProblem(id)) throw std::invalid_argument("Unknown problem id " + std::to_string(id));
    std::cout << StatusName(session.Status(id)) << '\n';
    for (auto& attempt : session.Ledger().History(id)) {
      std::cout << FormatDate(FromUnixMicros(attempt.timestamp)) << '\t'
                << OutcomeName(attempt.Outcome()) << '\t' << attempt.duration << "s\n";
    }
    if (auto rec = db.GetReviewState(id)) {
      std::cout << "stability " << rec->stability << ", difficulty " << rec->difficulty
                << ", due " << FormatDate(FromUnixMicros(rec->next_review_due)) << '\n';
    }
    return 0;
  }
  std::cerr << parser;
  return 1;
}

} // namespace

int main(int argc, char** argv) {
  spdlog::set_pattern("[%t] %+");
  InitLogger();

  int verbosity = 0;
  argparse::ArgumentParser parser(argc ? argv[0] : "trainer-cli", "1.0", argparse::default_arguments::help);
  parser.add_argument("-c", "--config")
    .default_value(std::string("/etc/trainer.conf"))
    .help("Path of configuration file");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");
  parser.add_argument("--workspace-root").help("Directory holding problem workspaces");
  parser.add_argument("--database").help("Path of the sqlite database");
  parser.add_argument("--run-timeout-ms")
    .scan<'d', long>()
    .help("Wall-clock limit of each test case");
  Commands cmd;
  for (auto sub : {&cmd.import_cmd, &cmd.contests_cmd, &cmd.problems_cmd, &cmd.open_cmd, &cmd.run_cmd,
                   &cmd.rate_cmd, &cmd.due_cmd, &cmd.status_cmd, &cmd.delete_cmd}) {
    parser.add_subparser(*sub);
  }

  try {
    parser.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << parser;
    return 1;
  }

  switch (verbosity) {
    case 0: spdlog::set_level(spdlog::level::warn); break;
    case 1: spdlog::set_level(spdlog::level::info); break;
    default: spdlog::set_level(spdlog::level::debug); break;
  }
  fs::path config_file = parser.get<std::string>("--config");
  if (!ParseConfig(config_file)) {
    if (parser.is_used("--config")) {
      spdlog::error("Failed to parse configuration file {}", config_file.string());
      return 1;
    }
    spdlog::info("No configuration file at {}; using defaults", config_file.string());
  }
  if (auto val = parser.present("--workspace-root")) kWorkspaceRoot = *val;
  if (auto val = parser.present("--database")) kDatabasePath = *val;
  if (auto val = parser.present<long>("--run-timeout-ms")) kRunTimeUs = *val * 1000;
  if (kDatabasePath.has_parent_path() && !CreateDirs(kDatabasePath.parent_path())) {
    spdlog::error("Cannot create data directory {}", kDatabasePath.parent_path().string());
    return 1;
  }

  try {
    return Dispatch(parser, cmd);
  } catch (const std::exception& e) {
    spdlog::error("{}", e.what());
    return 1;
  }
}
