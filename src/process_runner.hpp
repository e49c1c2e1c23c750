#pragma once

#include <functional>
#include <string>
#include <vector>

struct ProcessRequest {
  std::vector<std::string> argv;
  bool background_priority = false;
};

struct ProcessResult {
  int exit_code = -1;
  std::vector<std::string> tail;    // last output lines, oldest first

  std::string tail_text() const;
};

using ProcessLineCallback = std::function<void(const std::string& line)>;
using ProcessLauncher = std::function<ProcessResult(const ProcessRequest&, const ProcessLineCallback&)>;

// Runs argv[0] from PATH with stdout and stderr merged. Output is split on
// '\n' and '\r' so carriage-return progress lines arrive one by one.
// Exit code 127 means the program could not be started; a child killed by a
// signal reports 128 + signal.
ProcessResult run_process(const ProcessRequest& request,
                          const ProcessLineCallback& on_line = {});

ProcessLauncher default_process_launcher();
