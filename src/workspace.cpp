#include "workspace.h"

#include <fstream>

#include <spdlog/spdlog.h>
#include <trainer/paths.h>
#include <trainer/utils.h>

const char kDefaultSolutionTemplate[] =
    "#include <bits/stdc++.h>\n"
    "using namespace std;\n"
    "\n"
    "int main() {\n"
    "  ios::sync_with_stdio(false);\n"
    "  cin.tie(nullptr);\n"
    "\n"
    "}\n";

namespace {

std::string StringField(const nlohmann::json& obj, const char* key, const char* fallback_key = nullptr) {
  auto it = obj.find(key);
  if (it != obj.end() && it->is_string()) return it->get<std::string>();
  if (fallback_key) return StringField(obj, fallback_key);
  return "";
}

} // namespace

std::string LoadSolutionTemplate(const fs::path& path) {
  if (path.empty()) return kDefaultSolutionTemplate;
  std::string content;
  if (!ReadFile(path, content)) {
    throw std::runtime_error("Cannot read solution template " + path.string());
  }
  return content;
}

fs::path SetupWorkspace(const std::string& contest, long problem_id,
                        const SampleStore& samples, const std::string& solution_template) {
  auto cases = samples.Get(contest, std::to_string(problem_id));
  fs::path workspace = WorkspacePath(contest, problem_id);
  if (!CreateDirs(workspace)) {
    throw std::runtime_error("Cannot create workspace " + workspace.string());
  }
  fs::path solution = SolutionPath(workspace);
  if (!fs::exists(solution) && !WriteFile(solution, solution_template)) {
    throw std::runtime_error("Cannot write " + solution.string());
  }
  if (!WriteFile(TestInputPath(workspace, 1), cases[0].input) ||
      !WriteFile(TestAnswerPath(workspace, 1), cases[0].output)) {
    throw std::runtime_error("Cannot write sample test into " + workspace.string());
  }
  spdlog::info("Workspace ready: contest={} problem={} path={}", contest, problem_id, workspace.c_str());
  return workspace;
}

bool WriteStartMarker(const fs::path& workspace, TimePoint started) {
  return WriteFile(StartMarkerPath(workspace), std::to_string(ToUnixMicros(started)) + "\n");
}

std::optional<TimePoint> ReadStartMarker(const fs::path& workspace) {
  fs::path marker = StartMarkerPath(workspace);
  if (!fs::exists(marker)) return std::nullopt;
  std::string content;
  if (!ReadFile(marker, content)) return std::nullopt;
  try {
    return FromUnixMicros(std::stoll(content));
  } catch (const std::logic_error&) {
    spdlog::warn("Malformed start marker {}", marker.c_str());
    return std::nullopt;
  }
}

std::vector<long> ImportContest(const fs::path& file, Database& db, SampleStore& samples) {
  std::ifstream fin(file);
  if (!fin) throw std::runtime_error("Cannot open " + file.string());
  nlohmann::json contest;
  try {
    fin >> contest;
  } catch (const nlohmann::json::exception& e) {
    throw std::runtime_error("Malformed contest file " + file.string() + ": " + e.what());
  }
  if (!contest.is_object()) throw std::runtime_error("Malformed contest file " + file.string());
  std::string contest_id = StringField(contest, "contest_id");
  if (contest_id.empty()) throw std::runtime_error("Missing contest_id in " + file.string());

  std::vector<long> ids;
  auto problems = contest.find("problems");
  if (problems == contest.end() || !problems->is_array()) {
    spdlog::warn("Contest {} lists no problems", contest_id);
    return ids;
  }
  for (auto& item : *problems) {
    if (!item.is_object()) continue;
    Problem problem{0, contest_id, StringField(item, "title", "id"), StringField(item, "body", "html_content")};
    long id = db.AddProblem(problem);
    ids.push_back(id);
    std::vector<TestCase> cases;
    if (auto it = item.find("samples"); it != item.end() && it->is_array()) {
      for (auto& sample : *it) {
        if (sample.is_object()) cases.push_back({StringField(sample, "in"), StringField(sample, "out")});
      }
    }
    if (cases.empty()) spdlog::warn("Problem {} ({}) has no samples", id, problem.title);
    samples.Put(contest_id, std::to_string(id), cases);
    spdlog::info("Imported problem: id={} contest={} title={} samples={}",
                 id, contest_id, problem.title, cases.size());
  }
  if (!samples.Save()) throw std::runtime_error("Cannot save samples cache");
  return ids;
}
