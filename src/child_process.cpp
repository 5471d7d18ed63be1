#include "child_process.hpp"

#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <initializer_list>
#include <stdexcept>
#include <utility>

extern char** environ;

namespace {

const size_t READ_CHUNK = 65536;

std::string stripLineEnd(std::string line) {
  if (!line.empty() && line.back() == '\r') line.pop_back();
  return line;
}

void setCloseOnExec(int fd) { fcntl(fd, F_SETFD, fcntl(fd, F_GETFD) | FD_CLOEXEC); }

} // namespace

ChildProcess::ChildProcess(const std::string& command)
    : pid(-1), out_fd(-1), err_fd(-1), reaped(false), exit_code(-1) {
  int out_pipe[2];
  int err_pipe[2];
  if (pipe(out_pipe) != 0) {
    throw std::runtime_error(std::string("Failed to open stdout pipe: ") + std::strerror(errno));
  }
  if (pipe(err_pipe) != 0) {
    int saved = errno;
    close(out_pipe[0]);
    close(out_pipe[1]);
    throw std::runtime_error(std::string("Failed to open stderr pipe: ") + std::strerror(saved));
  }
  for (int fd : {out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1]}) {
    setCloseOnExec(fd);
  }

  // dup2 clears close-on-exec on the child's stdout and stderr
  posix_spawn_file_actions_t actions;
  posix_spawn_file_actions_init(&actions);
  posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
  posix_spawn_file_actions_adddup2(&actions, out_pipe[1], STDOUT_FILENO);
  posix_spawn_file_actions_adddup2(&actions, err_pipe[1], STDERR_FILENO);

  std::string shell = "/bin/sh";
  std::string flag = "-c";
  std::string cmd = command;
  char* argv[] = {&shell[0], &flag[0], &cmd[0], nullptr};

  int status = posix_spawn(&pid, shell.c_str(), &actions, nullptr, argv, environ);
  posix_spawn_file_actions_destroy(&actions);
  close(out_pipe[1]);
  close(err_pipe[1]);

  if (status != 0) {
    close(out_pipe[0]);
    close(err_pipe[0]);
    throw std::runtime_error("Failed to start '" + command + "': " + std::strerror(status));
  }

  out_fd = out_pipe[0];
  err_fd = err_pipe[0];
}

ChildProcess::~ChildProcess() {
  closeFd(out_fd);
  closeFd(err_fd);
  if (!reaped && pid > 0) {
    int status = 0;
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
  }
}

void ChildProcess::closeFd(int& fd) {
  if (fd >= 0) {
    close(fd);
    fd = -1;
  }
}

void ChildProcess::readFrom(int& fd, std::string& partial, bool is_stdout) {
  char buffer[READ_CHUNK];
  ssize_t count = read(fd, buffer, sizeof(buffer));
  if (count < 0 && (errno == EINTR || errno == EAGAIN)) {
    return;
  }

  if (count <= 0) {
    // End of stream: a last line without newline still counts
    if (!partial.empty()) {
      if (is_stdout) {
        out_lines.push_back(stripLineEnd(partial));
      } else {
        err_lines.push_back(stripLineEnd(partial));
      }
      partial.clear();
    }
    closeFd(fd);
    return;
  }

  partial.append(buffer, static_cast<size_t>(count));
  size_t start = 0;
  size_t eol;
  while ((eol = partial.find('\n', start)) != std::string::npos) {
    std::string line = stripLineEnd(partial.substr(start, eol - start));
    if (is_stdout) {
      out_lines.push_back(line);
    } else {
      err_lines.push_back(line);
    }
    start = eol + 1;
  }
  partial.erase(0, start);
}

void ChildProcess::pump() {
  struct pollfd fds[2];
  nfds_t nfds = 0;
  if (out_fd >= 0) fds[nfds++] = {out_fd, POLLIN, 0};
  if (err_fd >= 0) fds[nfds++] = {err_fd, POLLIN, 0};
  if (nfds == 0) return;

  int ready = poll(fds, nfds, -1);
  if (ready < 0) {
    if (errno == EINTR) return;
    throw std::runtime_error(std::string("poll() failed on child output: ") + std::strerror(errno));
  }

  for (nfds_t i = 0; i < nfds; i++) {
    if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) continue;
    if (fds[i].fd == out_fd) {
      readFrom(out_fd, out_partial, true);
    } else if (fds[i].fd == err_fd) {
      readFrom(err_fd, err_partial, false);
    }
  }
}

bool ChildProcess::nextLine(std::string& line) {
  while (out_lines.empty() && out_fd >= 0) {
    pump();
  }
  if (out_lines.empty()) {
    return false;
  }
  line = std::move(out_lines.front());
  out_lines.pop_front();
  return true;
}

int ChildProcess::wait() {
  while (out_fd >= 0 || err_fd >= 0) {
    pump();
  }
  if (reaped) {
    return exit_code;
  }

  int status = 0;
  pid_t result;
  do {
    result = waitpid(pid, &status, 0);
  } while (result < 0 && errno == EINTR);
  if (result < 0) {
    throw std::runtime_error(std::string("waitpid() failed: ") + std::strerror(errno));
  }
  reaped = true;

  if (WIFEXITED(status)) {
    exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    exit_code = 128 + WTERMSIG(status);
  } else {
    exit_code = -1;
  }
  return exit_code;
}
