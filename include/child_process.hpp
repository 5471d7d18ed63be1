#pragma once

#include <sys/types.h>

#include <deque>
#include <string>
#include <vector>

/**
 * @brief A shell command running as a child process with captured output.
 *
 * The command is started with "/bin/sh -c" and its standard output and
 * standard error are connected to two pipes; standard input is /dev/null.
 * Both pipes are read together with poll(), so the child can never stall on a
 * full pipe while the other one is being waited on.
 *
 * Standard output is consumed as a finite sequence of lines with nextLine().
 * Standard error lines are collected on the side and returned by
 * errorLines(). wait() drains whatever is left on both pipes before reaping
 * the child. The destructor closes the pipes and reaps the child if wait()
 * was never called.
 */
class ChildProcess {
 private:
  pid_t pid; ///< Process ID of the shell running the command
  int out_fd; ///< Read end of the stdout pipe, -1 once closed
  int err_fd; ///< Read end of the stderr pipe, -1 once closed
  std::string out_partial; ///< Stdout bytes after the last newline
  std::string err_partial; ///< Stderr bytes after the last newline
  std::deque<std::string> out_lines; ///< Complete stdout lines not yet returned
  std::vector<std::string> err_lines; ///< Complete stderr lines
  bool reaped; ///< True once waitpid() returned for the child
  int exit_code; ///< Exit code after wait()

 public:
  /**
   * @brief Starts the command.
   *
   * @param command Shell command line
   * @throws std::runtime_error if the pipes cannot be created or the shell cannot be started
   */
  explicit ChildProcess(const std::string& command);
  ~ChildProcess();

  ChildProcess(const ChildProcess&) = delete;
  ChildProcess& operator=(const ChildProcess&) = delete;

  /**
   * @brief Returns the next line of standard output.
   *
   * Blocks until a complete line is available or standard output is closed.
   * The trailing newline (and carriage return) is removed. A last line
   * without a newline is returned as well.
   *
   * @param line Receives the line
   * @return False once standard output is exhausted
   */
  bool nextLine(std::string& line);

  /**
   * @brief Drains both pipes and waits for the child to exit.
   *
   * Remaining standard output lines stay available through nextLine().
   *
   * @return The exit status, or 128 + signal number if the child was killed by a signal
   */
  int wait();

  const std::vector<std::string>& errorLines() const { return err_lines; }

 private:
  void pump();
  void readFrom(int& fd, std::string& partial, bool is_stdout);
  void closeFd(int& fd);
};
