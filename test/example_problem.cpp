#include "example_problem.h"

#include <cstdlib>
#include <fstream>
#include <trainer/paths.h>

const char kEchoSolution[] = R"(#include <cstdio>
int main(){ int a; scanf("%d",&a); printf("%d\n",a); })";

void ExampleProblem::SetUp(int td_num) {
  std::vector<std::pair<std::string, std::string>> tds;
  for (int i = 1; i <= td_num; i++) tds.emplace_back(std::to_string(i) + '\n', std::to_string(i) + '\n');
  SetUp(tds);
}

void ExampleProblem::SetUp(const std::vector<std::pair<std::string, std::string>>& tds) {
  {
    char ws_path_tmp[256] = "/tmp/trainer_test_XXXXXX";
    if (!mkdtemp(ws_path_tmp)) throw std::runtime_error("Failed to create");
    ws_path = ws_path_tmp;
  }
  for (int i = 0; i < (int)tds.size(); i++) {
    std::ofstream f1(TestInputPath(ws_path, i + 1)), f2(TestAnswerPath(ws_path, i + 1));
    f1 << tds[i].first;
    f2 << tds[i].second;
  }
  opt.run_time = 2'000'000;
  opt.compile_time = 60'000'000;
  opt.max_output = 1024;
}

void ExampleProblem::TearDown() {
  if (!ws_path.empty()) fs::remove_all(ws_path);
}

void ExampleProblem::WriteSolution(const std::string& code) {
  std::ofstream fout(SolutionPath(ws_path));
  fout << code;
}

VerificationResult ExampleProblem::Run() {
  return RunTests(SolutionPath(ws_path), opt);
}
