#ifndef INCLUDE_TRAINER_PROCESS_H_
#define INCLUDE_TRAINER_PROCESS_H_

#include <atomic>
#include <string>
#include <vector>

class ExecOptions {
 public:
  std::vector<std::string> command; // argv; argv[0] is looked up in PATH
  std::string workdir; // empty for current directory
  std::string input; // fed to stdin, then stdin is closed
  long wall_time; // us; 0 for no limit
  long max_output; // KiB, for stdout and stderr each; 0 for no limit
  const std::atomic_bool* cancel;

  ExecOptions() : wall_time(0), max_output(0), cancel(nullptr) {}
};

struct ExecResult {
  int error; // errno if the child could not be started or waited; other fields are invalid then
  int exit_code;
  int signal; // terminating signal, 0 if exited normally
  bool timed_out;
  bool output_exceeded;
  bool cancelled;
  long wall_time; // us
  std::string output, error_output;

  ExecResult() :
      error(0), exit_code(0), signal(0),
      timed_out(false), output_exceeded(false), cancelled(false),
      wall_time(0) {}
};

// Runs the command in its own process group and blocks until it exits
// or is killed by a limit.
ExecResult Execute(const ExecOptions&);

// SIGINT and SIGTERM set the returned flag instead of terminating the process,
// so a run holding it as its cancel flag kills its child group and returns.
std::atomic_bool* CancelOnSignals();

#endif  // INCLUDE_TRAINER_PROCESS_H_
