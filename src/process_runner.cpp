#include "process_runner.hpp"

#include <ctime>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <system_error>

#include "child_process.hpp"
#include "util.hpp"

namespace fs = std::filesystem;

RunInvocation RunInvocation::fromConfig(const Config& config) {
  RunInvocation invocation;
  invocation.binary = config.getBinary();
  invocation.setup_command = config.getSetupCommand();
  invocation.data_dir = config.getDataDir();
  invocation.restart_marker = config.getRestartMarker();
  invocation.use_parallel = config.getParallel().enabled;
  invocation.n_cores = config.getNCores();
  invocation.launcher = config.getParallel().launcher;
  invocation.resume = config.getResume();
  invocation.auto_restart = config.getAutoRestart();
  invocation.flags = config.getFlags();
  return invocation;
}

std::string buildCommand(const Model& model, const RunInvocation& invocation) {
  std::error_code ec;
  std::string command = "cd " + shellQuote(model.directory.string()) + "; ";

  if (!invocation.setup_command.empty() && !fs::exists(model.directory / invocation.data_dir, ec)) {
    command += invocation.setup_command + "; ";
  }

  if (invocation.use_parallel) {
    command += invocation.launcher + " " + std::to_string(invocation.n_cores) + " ";
  }

  command += invocation.binary + " ";

  bool has_saved_state = fs::exists(model.directory / (model.root + invocation.restart_marker), ec);
  if (invocation.resume || (invocation.auto_restart && has_saved_state)) {
    command += "-r ";
  }

  for (const auto& flag : invocation.flags) {
    command += flag + " ";
  }

  command += model.root + ".pf";
  return command;
}

ProcessRunner::ProcessRunner(const Logger& logger_, const LineClassifier& classifier_)
    : logger(logger_), classifier(classifier_) {}

RunResult ProcessRunner::run(const Model& model, const RunInvocation& invocation) {
  fs::path log_path = model.runLog();
  std::ofstream run_log(log_path, std::ios::app);
  if (!run_log) {
    throw std::runtime_error("Could not open run log " + log_path.string());
  }
  run_log << formatLocalTime(std::time(nullptr), "%Y-%m-%d %H:%M:%S") << "\n";

  std::string command = buildCommand(model, invocation);
  logger.log("Running: " + command);

  ChildProcess child(command);
  RunResult result;

  bool following = true;
  std::string line;
  while (child.nextLine(line)) {
    run_log << line << "\n";
    result.lines.push_back(line);
    if (!following) continue;

    Classification classification = classifier.classify(line);
    for (const auto& message : classification.emit) {
      logger.log(message);
    }
    following = classification.keep_going;
  }

  result.exit_code = child.wait();
  result.error_lines = child.errorLines();
  for (const auto& error_line : result.error_lines) {
    run_log << error_line << "\n";
  }
  run_log.flush();

  if (!result.error_lines.empty()) {
    logger.warning("The simulation wrote " + std::to_string(result.error_lines.size()) + " line(s) to stderr, see " +
                   log_path.string());
  }
  if (result.exit_code != 0) {
    logger.error("Simulation exited with non-zero exit code " + std::to_string(result.exit_code) + " for " +
                 model.name());
  }

  return result;
}
