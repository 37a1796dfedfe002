//
// Runs strategy variants as child processes inside a conda environment
//
#include "conda_process_runner.h"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <fstream>
#include <spdlog/spdlog.h>
#include <sstream>
#include <stdexcept>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace fs = std::filesystem;

namespace asset_matrix::runner {

namespace {

int OpenCaptureFile(const fs::path &path) {
  const int fd = ::open(path.c_str(), O_CREAT | O_WRONLY | O_TRUNC | O_CLOEXEC, 0644);
  if (fd < 0) {
    throw std::runtime_error(std::format("Failed to open capture file {}: {}",
                                         path.string(), std::strerror(errno)));
  }
  return fd;
}

std::string ReadCaptureFile(const fs::path &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    return {};
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

// Closes both capture descriptors on every exit path of Execute
class FdPair {
public:
  FdPair(int out, int err) : m_out(out), m_err(err) {}
  ~FdPair() { Close(); }
  FdPair(const FdPair &) = delete;
  FdPair &operator=(const FdPair &) = delete;

  void Close() noexcept {
    if (m_out >= 0) ::close(m_out);
    if (m_err >= 0) ::close(m_err);
    m_out = m_err = -1;
  }
  [[nodiscard]] int Out() const { return m_out; }
  [[nodiscard]] int Err() const { return m_err; }

private:
  int m_out;
  int m_err;
};

} // namespace

std::string LastNonBlankLine(const std::string &text) {
  auto end = text.find_last_not_of(" \t\r\n");
  if (end == std::string::npos) {
    return {};
  }
  auto start = text.rfind('\n', end);
  start = (start == std::string::npos) ? 0 : start + 1;
  const auto first = text.find_first_not_of(" \t", start);
  return text.substr(first, end - first + 1);
}

CondaProcessRunner::CondaProcessRunner(std::string python)
    : m_launcher{"conda", "run", "-n", std::string{ENV_TOKEN}, std::move(python)} {}

void CondaProcessRunner::SetLauncher(std::vector<std::string> launcher) {
  if (launcher.empty()) {
    throw std::invalid_argument("Launcher command must not be empty");
  }
  m_launcher = std::move(launcher);
}

std::vector<std::string>
CondaProcessRunner::BuildCommand(const fs::path &variantPath,
                                 const std::string &environmentName) const {
  std::vector<std::string> command;
  command.reserve(m_launcher.size() + 1);
  for (const auto &token : m_launcher) {
    command.push_back(token == ENV_TOKEN ? environmentName : token);
  }
  command.push_back(variantPath.string());
  return command;
}

RunOutcome CondaProcessRunner::Execute(const fs::path &variantPath,
                                       const std::string &environmentName,
                                       std::chrono::seconds timeout) {
  const auto command = BuildCommand(variantPath, environmentName);
  const fs::path stdoutPath = variantPath.string() + ".stdout";
  const fs::path stderrPath = variantPath.string() + ".stderr";

  // argv is prepared before fork: the child may only make async-signal-safe calls
  std::vector<char *> argv;
  argv.reserve(command.size() + 1);
  for (const auto &arg : command) {
    argv.push_back(const_cast<char *>(arg.c_str()));
  }
  argv.push_back(nullptr);

  FdPair fds(OpenCaptureFile(stdoutPath), OpenCaptureFile(stderrPath));
  SPDLOG_DEBUG("Launching {} (timeout {}s)", command.back(), timeout.count());

  const auto deadline = std::chrono::steady_clock::now() + timeout;
  const pid_t pid = ::fork();
  if (pid < 0) {
    throw std::runtime_error(std::format("fork failed: {}", std::strerror(errno)));
  }

  if (pid == 0) {
    ::setpgid(0, 0);
    const int devNull = ::open("/dev/null", O_RDONLY);
    if (devNull >= 0) {
      ::dup2(devNull, STDIN_FILENO);
    }
    if (::dup2(fds.Out(), STDOUT_FILENO) < 0 || ::dup2(fds.Err(), STDERR_FILENO) < 0) {
      _exit(127);
    }
    ::execvp(argv[0], argv.data());
    _exit(127);
  }

  ::setpgid(pid, pid);
  fds.Close();

  int status = 0;
  bool timedOut = false;
  while (true) {
    const pid_t waited = ::waitpid(pid, &status, WNOHANG);
    if (waited == pid) {
      break;
    }
    if (waited < 0) {
      if (errno == EINTR) continue;
      throw std::runtime_error(std::format("waitpid failed: {}", std::strerror(errno)));
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      timedOut = true;
      ::kill(-pid, SIGKILL);
      while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
      }
      break;
    }
    std::this_thread::sleep_for(m_pollInterval);
  }

  RunOutcome outcome;
  outcome.stdout_text = ReadCaptureFile(stdoutPath);
  outcome.stderr_text = ReadCaptureFile(stderrPath);

  if (timedOut) {
    outcome.timed_out = true;
    outcome.error = std::format("Timed out after {}s", timeout.count());
    return outcome;
  }

  if (WIFEXITED(status)) {
    const int code = WEXITSTATUS(status);
    if (code == 0) {
      outcome.success = true;
      return outcome;
    }
    if (code == 127) {
      outcome.error = std::format("Failed to launch {}", command.front());
      return outcome;
    }
    const auto lastLine = LastNonBlankLine(outcome.stderr_text);
    outcome.error = lastLine.empty() ? std::format("Exit code {}", code)
                                     : std::format("Exit code {}: {}", code, lastLine);
    return outcome;
  }

  if (WIFSIGNALED(status)) {
    outcome.error = std::format("Killed by signal {}", WTERMSIG(status));
    return outcome;
  }

  outcome.error = "Process ended in an unknown state";
  return outcome;
}

} // namespace asset_matrix::runner
