#include "storyflow/process.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <stdexcept>
#include <string_view>
#include <thread>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char **environ;

namespace storyflow {

namespace {

constexpr auto kReapInterval = std::chrono::milliseconds(10);

void close_fd(int &fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

// Read whatever is available; returns false at EOF.
bool drain(int fd, std::string &sink) {
  char buf[4096];
  for (;;) {
    const auto n = ::read(fd, buf, sizeof(buf));
    if (n > 0) {
      sink.append(buf, static_cast<std::size_t>(n));
      continue;
    }
    if (n == 0)
      return false;
    if (errno == EINTR)
      continue;
    return errno == EAGAIN || errno == EWOULDBLOCK;
  }
}

// argv/envp are built before fork(): the child only calls async-signal-safe code
struct ExecImage {
  std::vector<std::string> env_storage;
  std::vector<char *> argv;
  std::vector<char *> envp;
};

ExecImage build_image(const ProcessSpec &spec) {
  ExecImage img;
  for (char **e = environ; e && *e; ++e) {
    std::string_view entry{*e};
    const auto eq = entry.find('=');
    const auto key = entry.substr(0, eq);
    const bool overridden = std::ranges::any_of(
        spec.env, [&](const auto &kv) { return kv.first == key; });
    if (!overridden)
      img.env_storage.emplace_back(entry);
  }
  for (const auto &[key, value] : spec.env) {
    img.env_storage.push_back(key + "=" + value);
  }
  for (auto &s : img.env_storage)
    img.envp.push_back(s.data());
  img.envp.push_back(nullptr);
  for (const auto &a : spec.argv)
    img.argv.push_back(const_cast<char *>(a.c_str()));
  img.argv.push_back(nullptr);
  return img;
}

void write_stderr(const char *a, const char *b) {
  [[maybe_unused]] auto n = ::write(STDERR_FILENO, a, std::strlen(a));
  n = ::write(STDERR_FILENO, ": ", 2);
  n = ::write(STDERR_FILENO, b, std::strlen(b));
  n = ::write(STDERR_FILENO, "\n", 1);
}

[[noreturn]] void exec_child(const ProcessSpec &spec, const ExecImage &img, int out_fd,
                             int err_fd) {
  ::setpgid(0, 0);
  ::dup2(out_fd, STDOUT_FILENO);
  ::dup2(err_fd, STDERR_FILENO);
  const int devnull = ::open("/dev/null", O_RDONLY);
  if (devnull >= 0) {
    ::dup2(devnull, STDIN_FILENO);
  }
  if (spec.cwd && ::chdir(spec.cwd->c_str()) != 0) {
    write_stderr(spec.cwd->c_str(), std::strerror(errno));
    ::_exit(127);
  }
  ::execvpe(img.argv[0], img.argv.data(), img.envp.data());
  write_stderr(img.argv[0], std::strerror(errno));
  ::_exit(127);
}

} // namespace

ProcessResult PosixCommandRunner::run(const ProcessSpec &spec) {
  if (spec.argv.empty()) {
    throw std::invalid_argument("run: empty argv");
  }
  int out_pipe[2];
  int err_pipe[2];
  if (::pipe2(out_pipe, O_CLOEXEC) != 0) {
    throw std::runtime_error(std::string("pipe failed: ") + std::strerror(errno));
  }
  if (::pipe2(err_pipe, O_CLOEXEC) != 0) {
    ::close(out_pipe[0]);
    ::close(out_pipe[1]);
    throw std::runtime_error(std::string("pipe failed: ") + std::strerror(errno));
  }

  const ExecImage img = build_image(spec);
  const pid_t pid = ::fork();
  if (pid < 0) {
    const std::string why = std::strerror(errno);
    for (int fd : {out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1]})
      ::close(fd);
    throw std::runtime_error("fork failed: " + why);
  }
  if (pid == 0) {
    exec_child(spec, img, out_pipe[1], err_pipe[1]);
  }
  // mirror the child's setpgid so the group exists before we may signal it
  ::setpgid(pid, pid);

  int out_fd = out_pipe[0];
  int err_fd = err_pipe[0];
  ::close(out_pipe[1]);
  ::close(err_pipe[1]);
  ::fcntl(out_fd, F_SETFL, O_NONBLOCK);
  ::fcntl(err_fd, F_SETFL, O_NONBLOCK);

  ProcessResult res;
  const bool bounded = spec.timeout.count() > 0;
  const auto deadline = std::chrono::steady_clock::now() + spec.timeout;

  while (out_fd >= 0 || err_fd >= 0) {
    int wait_ms = -1;
    if (bounded) {
      const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
          deadline - std::chrono::steady_clock::now());
      if (left.count() <= 0) {
        res.timed_out = true;
        break;
      }
      wait_ms = static_cast<int>(left.count());
    }
    pollfd fds[2];
    nfds_t n = 0;
    if (out_fd >= 0)
      fds[n++] = pollfd{.fd = out_fd, .events = POLLIN, .revents = 0};
    if (err_fd >= 0)
      fds[n++] = pollfd{.fd = err_fd, .events = POLLIN, .revents = 0};
    const int rc = ::poll(fds, n, wait_ms);
    if (rc < 0) {
      if (errno == EINTR)
        continue;
      break;
    }
    for (nfds_t i = 0; i < n; ++i) {
      if (fds[i].revents == 0)
        continue;
      if (fds[i].fd == out_fd && !drain(out_fd, res.out))
        close_fd(out_fd);
      else if (fds[i].fd == err_fd && !drain(err_fd, res.err))
        close_fd(err_fd);
    }
  }

  close_fd(out_fd);
  close_fd(err_fd);

  int status = 0;
  bool reaped = false;
  // the child may close both pipes and keep running; the deadline still holds
  while (bounded && !res.timed_out) {
    const pid_t rc = ::waitpid(pid, &status, WNOHANG);
    if (rc == pid) {
      reaped = true;
      break;
    }
    if (rc < 0 && errno != EINTR)
      break;
    if (std::chrono::steady_clock::now() >= deadline) {
      res.timed_out = true;
      break;
    }
    std::this_thread::sleep_for(kReapInterval);
  }
  if (res.timed_out) {
    ::kill(-pid, SIGKILL);
  }
  if (!reaped) {
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
  }
  if (WIFEXITED(status)) {
    res.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    res.exit_code = 128 + WTERMSIG(status);
  }
  return res;
}

} // namespace storyflow
