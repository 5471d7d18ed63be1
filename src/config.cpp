#include "config.hpp"

#include <cmath>
#include <cstddef>
#include <iostream>
#include <set>
#include <sstream>
#include <string>
#include <vector>

#include "config_defaults.hpp"
#include "config_validators.hpp"
#include "util.hpp"

namespace {

// Renders a string as a quoted, escaped TOML string
std::string printString(const std::string& value) {
  std::ostringstream out;
  out << toml::value<std::string>(value);
  return out.str();
}

// Renders a vector of strings as a TOML array
std::string printStringArray(const std::vector<std::string>& values) {
  toml::array array;
  for (const auto& value : values) {
    array.push_back(value);
  }
  std::ostringstream out;
  out << array;
  return out.str();
}

} // namespace

Config::Config(const Logger& logger, const toml::table& toml, const ConfigOverrides& overrides) : logger(logger) {
  try {
    // Simulation invocation
    binary = validators::field<std::string>(toml, "binary").valueOr(ConfigDefaults::BINARY);
    flags = validators::vectorField<std::string>(toml, "flags").valueOr({});
    setup_command = validators::field<std::string>(toml, "setup_command").valueOr(ConfigDefaults::SETUP_COMMAND);
    data_dir = validators::field<std::string>(toml, "data_dir").valueOr(ConfigDefaults::DATA_DIR);
    restart_marker = validators::field<std::string>(toml, "restart_marker").valueOr(ConfigDefaults::RESTART_MARKER);
    search_dir = validators::field<std::string>(toml, "search_dir").valueOr(ConfigDefaults::SEARCH_DIR);

    // Run control
    auto verbosity_str = toml["verbosity"].value<std::string>();
    verbosity = parseEnum(verbosity_str, VERBOSITY_MAP, ConfigDefaults::VERBOSITY);
    if (verbosity_str.has_value() && !parseEnum(*verbosity_str, VERBOSITY_MAP).has_value()) {
      logger.exitWithError("Unknown verbosity level: " + *verbosity_str);
    }

    resume = validators::field<bool>(toml, "resume").valueOr(ConfigDefaults::RESUME);
    auto_restart = validators::field<bool>(toml, "auto_restart").valueOr(ConfigDefaults::AUTO_RESTART);
    convergence_threshold = validators::field<double>(toml, "convergence_threshold")
                                .greaterThanEqual(0.0)
                                .lessThanEqual(1.0)
                                .valueOr(ConfigDefaults::CONVERGENCE_THRESHOLD);

    parallel = parseParallel(toml);
    split_cycles = parseSplitCycles(toml);

  } catch (const validators::ValidationError& e) {
    logger.exitWithError(std::string(e.what()));
  }

  // Command-line options win over the file, then check the combined settings
  applyOverrides(overrides);
  validate();
}

Config Config::fromFile(const std::string& filename, const Logger& logger, const ConfigOverrides& overrides) {
  if (!hasSuffix(filename, ".toml")) {
    logger.warning("Configuration file '" + filename + "' does not have a .toml extension, parsing it as TOML.");
  }
  toml::table toml;
  try {
    toml = toml::parse_file(filename);
  } catch (const toml::parse_error& e) {
    logger.exitWithError("Failed to parse configuration file '" + filename + "': " + std::string(e.description()));
  }
  return Config(logger, toml, overrides);
}

Config Config::fromTomlString(const std::string& toml_content, const Logger& logger,
                              const ConfigOverrides& overrides) {
  toml::table toml;
  try {
    toml = toml::parse(toml_content);
  } catch (const toml::parse_error& e) {
    logger.exitWithError("Failed to parse configuration: " + std::string(e.description()));
  }
  return Config(logger, toml, overrides);
}

ParallelSettings Config::parseParallel(const toml::table& toml) const {
  ParallelSettings settings{ConfigDefaults::PARALLEL_ENABLED, ConfigDefaults::PARALLEL_CORES,
                            ConfigDefaults::PARALLEL_LAUNCHER};

  const toml::table* table = validators::getOptionalTable(toml, "parallel");
  if (!table) {
    return settings;
  }

  validators::requireKnownKeys(*table, {"enabled", "cores", "launcher"}, "parallel");
  settings.enabled = validators::field<bool>(*table, "enabled").valueOr(ConfigDefaults::PARALLEL_ENABLED);
  settings.cores = validators::field<size_t>(*table, "cores").positive().valueOr(ConfigDefaults::PARALLEL_CORES);
  settings.launcher = validators::field<std::string>(*table, "launcher").valueOr(ConfigDefaults::PARALLEL_LAUNCHER);
  return settings;
}

SplitCycleSettings Config::parseSplitCycles(const toml::table& toml) const {
  SplitCycleSettings settings{ConfigDefaults::SPLIT_CYCLES, ConfigDefaults::RESTART_PHOTONS_PER_CYCLE,
                              ConfigDefaults::RESTART_SPECTRUM_CYCLES, ConfigDefaults::RESTORE_POLICY};

  const toml::table* table = validators::getOptionalTable(toml, "split_cycles");
  if (!table) {
    return settings;
  }

  validators::requireKnownKeys(*table, {"enabled", "photons_per_cycle", "spectrum_cycles", "restore_policy"},
                               "split_cycles");
  settings.enabled = validators::field<bool>(*table, "enabled").valueOr(ConfigDefaults::SPLIT_CYCLES);
  settings.photons_per_cycle =
      validators::field<std::string>(*table, "photons_per_cycle").valueOr(ConfigDefaults::RESTART_PHOTONS_PER_CYCLE);
  settings.spectrum_cycles =
      validators::field<std::string>(*table, "spectrum_cycles").valueOr(ConfigDefaults::RESTART_SPECTRUM_CYCLES);

  auto policy_str = (*table)["restore_policy"].value<std::string>();
  if (policy_str.has_value()) {
    auto policy = parseEnum(*policy_str, RESTORE_POLICY_MAP);
    if (!policy.has_value()) {
      throw validators::ValidationError("restore_policy", "unknown policy '" + *policy_str + "'");
    }
    settings.restore_policy = *policy;
  }
  return settings;
}

void Config::applyOverrides(const ConfigOverrides& overrides) {
  if (overrides.search_dir.has_value()) search_dir = *overrides.search_dir;
  if (overrides.flags.has_value()) flags = *overrides.flags;
  if (overrides.verbosity.has_value()) verbosity = *overrides.verbosity;
  if (overrides.resume.has_value()) resume = *overrides.resume;
  if (overrides.auto_restart.has_value()) auto_restart = *overrides.auto_restart;
  if (overrides.split_cycles.has_value()) split_cycles.enabled = *overrides.split_cycles;
  if (overrides.convergence_threshold.has_value()) convergence_threshold = *overrides.convergence_threshold;
  if (overrides.n_cores.has_value()) {
    parallel.cores = *overrides.n_cores;
    parallel.enabled = parallel.cores > 1;
  }
}

void Config::validate() const {
  if (binary.empty()) {
    logger.exitWithError("binary cannot be empty");
  }
  if (!std::isfinite(convergence_threshold) || convergence_threshold < 0.0 || convergence_threshold > 1.0) {
    logger.exitWithError("convergence_threshold must be within [0, 1], got " + std::to_string(convergence_threshold));
  }
  if (parallel.enabled && parallel.launcher.empty()) {
    logger.exitWithError("parallel launch is enabled but no launcher is set");
  }
  if (split_cycles.enabled && split_cycles.spectrum_cycles == "0") {
    logger.exitWithError("split_cycles.spectrum_cycles must be non-zero for the spectrum restart");
  }
  if (resume && split_cycles.enabled) {
    logger.warning("resume is set together with split cycles: the ionization run continues from its saved state.");
  }
}

void Config::printConfig(std::stringstream& log) const {
  log << "# Configuration settings\n";
  log << "binary = " << printString(binary) << "\n";
  log << "flags = " << printStringArray(flags) << "\n";
  log << "setup_command = " << printString(setup_command) << "\n";
  log << "data_dir = " << printString(data_dir) << "\n";
  log << "restart_marker = " << printString(restart_marker) << "\n";
  log << "search_dir = " << printString(search_dir) << "\n";
  log << "verbosity = \"" << enumToString(verbosity, VERBOSITY_MAP) << "\"\n";
  log << "resume = " << (resume ? "true" : "false") << "\n";
  log << "auto_restart = " << (auto_restart ? "true" : "false") << "\n";
  log << "convergence_threshold = " << convergence_threshold << "\n";
  log << "\n[parallel]\n";
  log << "enabled = " << (parallel.enabled ? "true" : "false") << "\n";
  log << "cores = " << parallel.cores << "\n";
  log << "launcher = " << printString(parallel.launcher) << "\n";
  log << "\n[split_cycles]\n";
  log << "enabled = " << (split_cycles.enabled ? "true" : "false") << "\n";
  log << "photons_per_cycle = " << printString(split_cycles.photons_per_cycle) << "\n";
  log << "spectrum_cycles = " << printString(split_cycles.spectrum_cycles) << "\n";
  log << "restore_policy = \"" << enumToString(split_cycles.restore_policy, RESTORE_POLICY_MAP) << "\"\n";
}
