#include "process.hpp"
#include <cerrno>
#include <cstring>
#include <sys/wait.h>
#include <unistd.h>

ExecResult run_process(const std::vector<std::string> &argv,
                       const std::filesystem::path &cwd) {
  ExecResult result;

  if (argv.empty()) {
    result.error = "empty command";
    return result;
  }

  std::vector<char *> args;
  for (const auto &s : argv) {
    args.push_back(const_cast<char *>(s.c_str()));
  }
  args.push_back(nullptr);

  std::string dir = cwd.string();

  pid_t pid = fork();

  if (pid == -1) {
    result.error = "fork failed: " + std::string(strerror(errno));
    return result;
  }

  if (pid == 0) {
    if (!dir.empty() && chdir(dir.c_str()) != 0) {
      _exit(126);
    }
    execvp(args[0], args.data());
    _exit(127);
  }

  int status = 0;
  while (waitpid(pid, &status, 0) == -1) {
    if (errno != EINTR) {
      result.error = "waitpid failed: " + std::string(strerror(errno));
      return result;
    }
  }

  if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
    result.ok = true;
    if (result.exit_code == 127) {
      result.error = "could not execute " + argv[0];
    } else if (result.exit_code == 126) {
      result.error = "could not enter directory " + dir;
    }
  } else if (WIFSIGNALED(status)) {
    result.exit_code = 128 + WTERMSIG(status);
    result.ok = true;
  } else {
    result.error = "process terminated abnormally";
  }

  return result;
}

std::string join_command(const std::vector<std::string> &argv) {
  std::string line;
  for (size_t i = 0; i < argv.size(); ++i) {
    if (i > 0)
      line += ' ';
    bool quote = argv[i].find(' ') != std::string::npos;
    if (quote)
      line += '"';
    line += argv[i];
    if (quote)
      line += '"';
  }
  return line;
}
