#pragma once

#include <filesystem>
#include <string>
#include <vector>

struct ExecResult {
  bool ok = false;
  int exit_code = -1;
  std::string error;

  bool succeeded() const { return ok && exit_code == 0; }
};

// fork/execvp argv[0] (looked up on PATH) inside cwd and wait for it.
ExecResult run_process(const std::vector<std::string> &argv,
                       const std::filesystem::path &cwd);

std::string join_command(const std::vector<std::string> &argv);
