#include <cstddef>
#include <map>
#include <string>

/**
 * @file defs.hpp
 * @brief Core type definitions and enumerations for simrun.
 *
 * This file contains the enumeration classes and string lookup tables used
 * throughout the run orchestrator: console verbosity levels, convergence
 * outcomes, orchestration states and the configuration restore policy.
 */

#pragma once

/**
 * @brief Ordered verbosity levels for console output.
 *
 * Each level includes everything printed by the levels below it. At ALL the
 * raw output of the simulation is echoed without any classification.
 */
enum class Verbosity {
  SILENT = 0,          ///< Print nothing from the simulation
  PROGRESS = 1,        ///< Cycle starts, cycle completion times, final run time
  EXTRA = 2,           ///< Adds photon transport times and cell convergence lines
  EXTRA_TRANSPORT = 3, ///< Adds photon transport progress
  ALL = 4              ///< Echo every line of simulation output
};

const std::map<std::string, Verbosity> VERBOSITY_MAP = {
    {"silent", Verbosity::SILENT},
    {"progress", Verbosity::PROGRESS},
    {"extra", Verbosity::EXTRA},
    {"transport", Verbosity::EXTRA_TRANSPORT},
    {"all", Verbosity::ALL}
};

/**
 * @brief Outcome of evaluating a model's convergence after a successful run.
 */
enum class ConvergenceState {
  CONVERGED,      ///< Last cycle fraction is at or above the threshold
  NOT_CONVERGED,  ///< Last cycle fraction is below the threshold
  AMBIGUOUS,      ///< Fraction outside [0, 1] or empty report: malformed diagnostics
  NO_INFORMATION  ///< No diagnostic file was written
};

const std::map<ConvergenceState, std::string> CONVERGENCE_STATE_NAMES = {
    {ConvergenceState::CONVERGED, "converged"},
    {ConvergenceState::NOT_CONVERGED, "not converged"},
    {ConvergenceState::AMBIGUOUS, "ambiguous"},
    {ConvergenceState::NO_INFORMATION, "no information"}
};

/**
 * @brief States of the per-model orchestration state machine.
 */
enum class RunState {
  NOT_STARTED,    ///< Nothing launched yet
  PRIMARY_RUN,    ///< First (or only) invocation of the simulation
  CONVERGED,      ///< Primary run converged
  NOT_CONVERGED,  ///< Primary run did not converge
  AMBIGUOUS,      ///< Convergence could not be decided
  NO_INFORMATION, ///< Primary run left no diagnostics to evaluate
  RESTART_RUN,    ///< Spectrum-synthesis restart in split-cycle mode
  DONE            ///< Finished, configuration restored where the policy requires it
};

const std::map<RunState, std::string> RUN_STATE_NAMES = {
    {RunState::NOT_STARTED, "not started"},
    {RunState::PRIMARY_RUN, "primary run"},
    {RunState::CONVERGED, "converged"},
    {RunState::NOT_CONVERGED, "not converged"},
    {RunState::AMBIGUOUS, "ambiguous"},
    {RunState::NO_INFORMATION, "no information"},
    {RunState::RESTART_RUN, "restart run"},
    {RunState::DONE, "done"}
};

/**
 * @brief When the parameter file is restored after a split-cycle run.
 *
 * ALWAYS restores the backup on every exit path. AFTER_RESTART only restores
 * it after the spectrum restart ran, leaving the ionization-only parameter
 * file on disk otherwise so the model can be resumed by hand.
 */
enum class RestorePolicy {
  ALWAYS,        ///< Restore after every split-cycle run
  AFTER_RESTART  ///< Restore only after the restart run
};

const std::map<std::string, RestorePolicy> RESTORE_POLICY_MAP = {
    {"always", RestorePolicy::ALWAYS},
    {"after_restart", RestorePolicy::AFTER_RESTART}
};

/* Structs to group certain configuration settings */

/**
 * @brief Settings for launching the simulation under a parallel launcher.
 */
struct ParallelSettings {
  bool enabled; ///< Prefix the command with the launcher
  size_t cores; ///< Number of processes requested from the launcher
  std::string launcher; ///< Launcher prefix, followed by the core count
};

/**
 * @brief Settings for split-cycle runs.
 */
struct SplitCycleSettings {
  bool enabled; ///< Run ionization and spectrum cycles as two invocations
  std::string photons_per_cycle; ///< Photons per cycle for the spectrum restart
  std::string spectrum_cycles; ///< Number of spectrum cycles for the restart
  RestorePolicy restore_policy; ///< When the original parameter file is restored
};
