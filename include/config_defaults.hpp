#pragma once

#include <cstddef>
#include <string>

#include "defs.hpp"

/**
 * @brief Centralized configuration defaults for simrun.
 *
 * This namespace contains all default values used in the configuration system.
 * Command-line options override these the same way as entries in the
 * configuration file.
 */
namespace ConfigDefaults {

// Simulation invocation
const std::string BINARY = "py"; ///< Name of the simulation executable
const std::string SETUP_COMMAND = "Setup_Py_Dir"; ///< One-time setup run when the data directory is missing
const std::string DATA_DIR = "data"; ///< Data directory expected inside each model directory
const std::string RESTART_MARKER = ".wind_save"; ///< Suffix of the saved-state file that enables implicit resume
const std::string SEARCH_DIR = "."; ///< Directory searched recursively for parameter files

// Run control
const Verbosity VERBOSITY = Verbosity::PROGRESS; ///< Default console verbosity
const bool RESUME = false; ///< Explicitly resume every model
const bool AUTO_RESTART = true; ///< Resume automatically when a restart marker exists
const double CONVERGENCE_THRESHOLD = 0.80; ///< Minimum converged fraction of cells (inclusive)

// Parallel launch
const bool PARALLEL_ENABLED = false; ///< Launch through the parallel launcher
const size_t PARALLEL_CORES = 1; ///< Number of processes for the launcher
const std::string PARALLEL_LAUNCHER = "mpirun -n"; ///< Launcher prefix, followed by the core count

// Split cycles
const bool SPLIT_CYCLES = false; ///< Run ionization and spectrum cycles separately
const std::string RESTART_PHOTONS_PER_CYCLE = "1e6"; ///< Photons per cycle for the spectrum restart
const std::string RESTART_SPECTRUM_CYCLES = "5"; ///< Spectrum cycles for the spectrum restart
const RestorePolicy RESTORE_POLICY = RestorePolicy::ALWAYS; ///< When the parameter file is restored

// Parameter file keys touched by split-cycle runs
const std::string KEY_SPECTRUM_CYCLES = "Spectrum_cycles";
const std::string KEY_PHOTONS_PER_CYCLE = "Photons_per_cycle";

} // namespace ConfigDefaults
