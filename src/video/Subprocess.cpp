#include "Subprocess.hpp"

#include "core/Errors.hpp"
#include "core/Logging.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <poll.h>
#include <sstream>
#include <sys/wait.h>
#include <unistd.h>

namespace reclaim {

namespace {
std::shared_ptr<spdlog::logger> subprocessLogger() {
  static auto logger = log::moduleLogger("Subprocess");
  return logger;
}

// Closes a pipe end on scope exit
class FdGuard {
public:
  explicit FdGuard(int fd = -1) noexcept : fd_(fd) {}
  ~FdGuard() { reset(); }
  FdGuard(const FdGuard &) = delete;
  FdGuard &operator=(const FdGuard &) = delete;

  int get() const noexcept { return fd_; }
  void reset(int fd = -1) noexcept {
    if (fd_ >= 0) {
      ::close(fd_);
    }
    fd_ = fd;
  }

private:
  int fd_;
};

void makePipe(FdGuard &readEnd, FdGuard &writeEnd, const std::string &tool) {
  int fds[2];
  if (::pipe2(fds, O_CLOEXEC) != 0) {
    throw MediaProcessingError(tool, std::string("pipe() failed: ") +
                                         std::strerror(errno));
  }
  readEnd.reset(fds[0]);
  writeEnd.reset(fds[1]);
}

// Reads whatever is available; returns false on EOF
bool drain(int fd, std::string &out) {
  std::array<char, 4096> buffer{};
  const ssize_t n = ::read(fd, buffer.data(), buffer.size());
  if (n > 0) {
    out.append(buffer.data(), static_cast<size_t>(n));
    return true;
  }
  if (n < 0 && (errno == EINTR || errno == EAGAIN)) {
    return true;
  }
  return false;
}

void killAndReap(pid_t pid) {
  ::kill(pid, SIGKILL);
  int status = 0;
  while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
  }
}

std::string tail(const std::string &text, size_t maxChars = 512) {
  return text.size() <= maxChars ? text : text.substr(text.size() - maxChars);
}
} // namespace

std::string Subprocess::joinArgs(const std::vector<std::string> &argv) {
  std::ostringstream oss;
  bool first = true;
  for (const auto &arg : argv) {
    if (!first) {
      oss << ' ';
    }
    first = false;
    if (arg.find_first_of(" \t\"'\\") == std::string::npos && !arg.empty()) {
      oss << arg;
    } else {
      oss << '"';
      for (char ch : arg) {
        if (ch == '"' || ch == '\\') {
          oss << '\\';
        }
        oss << ch;
      }
      oss << '"';
    }
  }
  return oss.str();
}

bool Subprocess::isAvailable(const std::string &program) {
  namespace fs = std::filesystem;
  std::error_code ec;
  if (program.find('/') != std::string::npos) {
    return ::access(program.c_str(), X_OK) == 0;
  }
  const char *path = std::getenv("PATH");
  if (!path) {
    return false;
  }
  std::istringstream dirs(path);
  std::string dir;
  while (std::getline(dirs, dir, ':')) {
    if (dir.empty()) {
      continue;
    }
    const fs::path candidate = fs::path(dir) / program;
    if (fs::is_regular_file(candidate, ec) &&
        ::access(candidate.c_str(), X_OK) == 0) {
      return true;
    }
  }
  return false;
}

ProcessResult Subprocess::run(const std::vector<std::string> &argv,
                              std::chrono::milliseconds timeout) {
  if (argv.empty()) {
    throw MediaProcessingError("subprocess", "empty command line");
  }
  const std::string &tool = argv.front();
  const std::string commandLine = joinArgs(argv);
  subprocessLogger()->debug("Running: {}", commandLine);

  FdGuard outRead, outWrite, errRead, errWrite;
  makePipe(outRead, outWrite, tool);
  makePipe(errRead, errWrite, tool);

  std::vector<char *> args;
  args.reserve(argv.size() + 1);
  for (const auto &arg : argv) {
    args.push_back(const_cast<char *>(arg.c_str()));
  }
  args.push_back(nullptr);

  const pid_t pid = ::fork();
  if (pid < 0) {
    throw MediaProcessingError(tool, std::string("fork() failed: ") +
                                         std::strerror(errno));
  }

  if (pid == 0) {
    ::dup2(outWrite.get(), STDOUT_FILENO);
    ::dup2(errWrite.get(), STDERR_FILENO);
    const int devNull = ::open("/dev/null", O_RDONLY);
    if (devNull >= 0) {
      ::dup2(devNull, STDIN_FILENO);
    }
    ::execvp(args[0], args.data());
    _exit(127); // exec failed
  }

  outWrite.reset();
  errWrite.reset();

  ProcessResult result;
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  bool outOpen = true;
  bool errOpen = true;

  while (outOpen || errOpen) {
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
      killAndReap(pid);
      subprocessLogger()->error("Timed out after {}ms: {}", timeout.count(),
                                commandLine);
      throw MediaProcessingError(
          tool, "timed out after " + std::to_string(timeout.count()) + "ms");
    }

    std::array<pollfd, 2> fds{};
    nfds_t count = 0;
    if (outOpen) {
      fds[count++] = {outRead.get(), POLLIN, 0};
    }
    if (errOpen) {
      fds[count++] = {errRead.get(), POLLIN, 0};
    }

    const int ready =
        ::poll(fds.data(), count, static_cast<int>(remaining.count()));
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      killAndReap(pid);
      throw MediaProcessingError(tool, std::string("poll() failed: ") +
                                           std::strerror(errno));
    }

    for (nfds_t i = 0; i < count; ++i) {
      if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) {
        continue;
      }
      if (fds[i].fd == outRead.get()) {
        outOpen = drain(outRead.get(), result.stdoutText);
      } else {
        errOpen = drain(errRead.get(), result.stderrText);
      }
    }
  }

  // Output is closed; the child may still be exiting
  int status = 0;
  for (;;) {
    const pid_t waited = ::waitpid(pid, &status, WNOHANG);
    if (waited == pid) {
      break;
    }
    if (waited < 0 && errno != EINTR) {
      throw MediaProcessingError(tool, std::string("waitpid() failed: ") +
                                           std::strerror(errno));
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      killAndReap(pid);
      subprocessLogger()->error("Timed out waiting for exit: {}", commandLine);
      throw MediaProcessingError(
          tool, "timed out after " + std::to_string(timeout.count()) + "ms");
    }
    ::usleep(1000);
  }

  if (WIFSIGNALED(status)) {
    throw MediaProcessingError(
        tool, "terminated by signal " + std::to_string(WTERMSIG(status)));
  }
  result.exitCode = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
  if (result.exitCode == 127 && result.stdoutText.empty()) {
    throw MediaProcessingError(tool, "could not be executed");
  }
  if (result.exitCode != 0) {
    subprocessLogger()->error("Command failed ({}): {}\n{}", result.exitCode,
                              commandLine, tail(result.stderrText));
    throw MediaProcessingError(tool, "exited with status " +
                                         std::to_string(result.exitCode) +
                                         ": " + tail(result.stderrText));
  }

  subprocessLogger()->debug("Completed: {}", commandLine);
  return result;
}

} // namespace reclaim
