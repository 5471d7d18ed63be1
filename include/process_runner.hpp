#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "config.hpp"
#include "logger.hpp"
#include "model.hpp"
#include "output_classifier.hpp"

/**
 * @brief Settings for one launch of the simulation for one model.
 */
struct RunInvocation {
  std::string binary; ///< Simulation executable
  std::string setup_command; ///< Setup step run when the data directory is missing, empty for none
  std::string data_dir; ///< Data directory expected inside the model directory
  std::string restart_marker; ///< Suffix of the saved-state file that enables implicit resume
  bool use_parallel; ///< Prefix the command with the parallel launcher
  size_t n_cores; ///< Number of processes requested from the launcher
  std::string launcher; ///< Parallel launcher prefix
  bool resume; ///< Request a restart from saved state
  bool auto_restart; ///< Resume automatically when the restart marker exists
  std::vector<std::string> flags; ///< Flags passed through to the simulation

  /**
   * @brief Builds the invocation for a first launch from the run configuration.
   */
  static RunInvocation fromConfig(const Config& config);
};

/**
 * @brief Outcome of one launch of the simulation.
 */
struct RunResult {
  int exit_code = 0; ///< Exit status, 0 for success, -1 if the launch itself failed
  std::vector<std::string> lines; ///< Every line the simulation wrote to stdout
  std::vector<std::string> error_lines; ///< Every line the simulation wrote to stderr
};

/**
 * @brief Assembles the shell command line for one invocation.
 *
 * "cd <dir>; [<setup>; ][<launcher> <cores> ]<binary> [-r ][<flags> ]<root>.pf"
 *
 * The setup step is only added when the model has no data directory yet. The
 * resume flag is added when the invocation requests it, or when the model's
 * restart marker file exists and automatic restart is enabled.
 */
std::string buildCommand(const Model& model, const RunInvocation& invocation);

/**
 * @brief Interface for launching the simulation for a model.
 */
class SimulationRunner {
 public:
  virtual ~SimulationRunner() = default;

  /**
   * @brief Runs the simulation for a model and waits for it to exit.
   *
   * @throws std::runtime_error if the simulation could not be launched
   */
  virtual RunResult run(const Model& model, const RunInvocation& invocation) = 0;
};

/**
 * @brief SimulationRunner that launches the simulation as a child process.
 *
 * Appends a time stamp and every raw output line to the model's run log
 * "<dir>/<root>.log.txt", and passes each stdout line to the classifier,
 * logging whatever it emits. Once the classifier asks to stop, the remaining
 * output is still drained into the run log, but no longer classified.
 */
class ProcessRunner : public SimulationRunner {
 private:
  const Logger& logger; ///< Console logger
  const LineClassifier& classifier; ///< Turns raw output into progress messages

 public:
  ProcessRunner(const Logger& logger, const LineClassifier& classifier);

  RunResult run(const Model& model, const RunInvocation& invocation) override;
};
