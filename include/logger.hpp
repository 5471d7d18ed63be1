#pragma once

#include <cstdlib>
#include <iostream>
#include <ostream>
#include <string>

/**
 * @brief Console logger that handles quiet mode and output redirection.
 *
 * Encapsulates the output streams and quiet mode to simplify logging calls
 * throughout the codebase. Informational messages go to the output stream and
 * can be suppressed by quiet mode; errors always go to the error stream.
 */
class Logger {
 private:
  std::ostream* out;
  std::ostream* err;
  bool quiet_mode;

 public:
  /**
   * @brief Constructs a logger writing to stdout and stderr.
   *
   * @param quiet If true, suppresses non-error output
   */
  explicit Logger(bool quiet = false) : out(&std::cout), err(&std::cerr), quiet_mode(quiet) {}

  /**
   * @brief Constructs a logger writing to the given streams.
   *
   * Used by unit tests to capture the console output of a run.
   *
   * @param out_ Stream for informational messages
   * @param err_ Stream for warnings and errors
   * @param quiet If true, suppresses non-error output
   */
  Logger(std::ostream& out_, std::ostream& err_, bool quiet = false) : out(&out_), err(&err_), quiet_mode(quiet) {}

  /**
   * @brief Logs a message to the output stream (respects quiet mode).
   *
   * @param message Message to log
   */
  void log(const std::string& message) const {
    if (!quiet_mode) {
      *out << message << std::endl;
    }
  }

  /**
   * @brief Logs a warning to the error stream (respects quiet mode).
   *
   * @param message Warning message to log
   */
  void warning(const std::string& message) const {
    if (!quiet_mode) {
      *err << "WARNING: " << message << std::endl;
    }
  }

  /**
   * @brief Logs an error message to the error stream.
   *
   * @param message Error message to log
   */
  void error(const std::string& message) const {
    *err << "ERROR: " << message << std::endl;
  }

  /**
   * @brief Logs an error and terminates the program.
   *
   * @param message Error message before exit
   */
  [[noreturn]]
  void exitWithError(const std::string& message) const {
    error(message);
    exit(1);
  }
};
