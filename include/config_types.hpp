#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "defs.hpp"

/**
 * @brief Configuration settings given on the command line.
 *
 * Contains all optional configuration parameters that can be provided on the
 * command line. Every field that is set replaces the value from the
 * configuration file (or the default) when the Config is constructed.
 */
struct ConfigOverrides {
  std::optional<std::string> search_dir;
  std::optional<std::vector<std::string>> flags;
  std::optional<Verbosity> verbosity;
  std::optional<bool> resume;
  std::optional<bool> auto_restart;
  std::optional<bool> split_cycles;
  std::optional<size_t> n_cores;
  std::optional<double> convergence_threshold;
};

/**
 * @brief Result of parsing the command line.
 */
struct ParsedArgs {
  std::optional<std::string> config_filename; ///< TOML configuration file, if given
  bool quietmode = false; ///< Suppress all non-error console output
  ConfigOverrides overrides; ///< Options that replace configuration file entries
};
