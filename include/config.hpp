#pragma once

#include <cstddef>
#include <sstream>
#include <string>
#include <toml++/toml.hpp>
#include <vector>

#include "config_types.hpp"
#include "defs.hpp"
#include "logger.hpp"

/**
 * @brief Final validated run configuration.
 *
 * Contains only validated, typed configuration parameters with defaults
 * applied and command-line overrides merged in. This class is immutable after
 * construction and is passed explicitly to the orchestrator, the process
 * runner and the output classifier.
 */
class Config {
 private:
  // Logging
  Logger logger; ///< Logger for configuration messages and fatal errors.

  // Simulation invocation
  std::string binary; ///< Name of the simulation executable
  std::vector<std::string> flags; ///< Flags passed through to the simulation
  std::string setup_command; ///< Setup step run when the data directory is missing
  std::string data_dir; ///< Data directory expected inside each model directory
  std::string restart_marker; ///< Suffix of the saved-state file that enables implicit resume
  std::string search_dir; ///< Directory searched for parameter files

  // Run control
  Verbosity verbosity; ///< Console verbosity for simulation output
  bool resume; ///< Resume every model explicitly
  bool auto_restart; ///< Resume models that have a saved state
  double convergence_threshold; ///< Minimum converged fraction, inclusive

  // Grouped settings
  ParallelSettings parallel; ///< Parallel launch settings
  SplitCycleSettings split_cycles; ///< Split-cycle settings

 public:
  Config(const Logger& logger, const toml::table& table, const ConfigOverrides& overrides = {});

  static Config fromFile(const std::string& filename, const Logger& logger, const ConfigOverrides& overrides = {});
  static Config fromTomlString(const std::string& toml_content, const Logger& logger,
                               const ConfigOverrides& overrides = {});

  void printConfig(std::stringstream& log) const;

  // getters
  const std::string& getBinary() const { return binary; }
  const std::vector<std::string>& getFlags() const { return flags; }
  const std::string& getSetupCommand() const { return setup_command; }
  const std::string& getDataDir() const { return data_dir; }
  const std::string& getRestartMarker() const { return restart_marker; }
  const std::string& getSearchDir() const { return search_dir; }
  Verbosity getVerbosity() const { return verbosity; }
  bool getResume() const { return resume; }
  bool getAutoRestart() const { return auto_restart; }
  double getConvergenceThreshold() const { return convergence_threshold; }
  const ParallelSettings& getParallel() const { return parallel; }
  size_t getNCores() const { return parallel.enabled ? parallel.cores : 1; }
  const SplitCycleSettings& getSplitCycles() const { return split_cycles; }
  bool getSplitCyclesEnabled() const { return split_cycles.enabled; }

 private:
  void applyOverrides(const ConfigOverrides& overrides);
  void validate() const;

  ParallelSettings parseParallel(const toml::table& toml) const;
  SplitCycleSettings parseSplitCycles(const toml::table& toml) const;
};
