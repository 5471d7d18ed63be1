#pragma once

#include <cstddef>
#include <ctime>
#include <functional>
#include <string>
#include <vector>

#include "defs.hpp"

/**
 * @brief Result of classifying one line of simulation output.
 */
struct Classification {
  std::vector<std::string> emit; ///< Human-readable lines to print, possibly none
  bool keep_going = true; ///< False once the output no longer needs to be followed
};

/**
 * @brief Interface for turning raw simulation output into progress messages.
 *
 * The process runner only depends on this interface, so the text matching
 * rules for the simulation output can be replaced without touching the runner
 * or the orchestrator.
 */
class LineClassifier {
 public:
  virtual ~LineClassifier() = default;

  virtual Classification classify(const std::string& line) const = 0;
};

/**
 * @brief Classifies one line of output of the radiative-transfer simulation.
 *
 * Lines are recognised by substring and numeric fields are taken from fixed
 * whitespace-delimited positions. Fields that do not parse as numbers are
 * forwarded unparsed. Below Verbosity::ALL only recognised lines produce
 * output, each gated by a minimum verbosity:
 *
 * | line                                             | level           |
 * |--------------------------------------------------|-----------------|
 * | "Beginning cycle i of n for defining wind/spectra" | PROGRESS      |
 * | "Completed ionization/spectrum cycle ... t"        | PROGRESS      |
 * | "Completed entire program ... t"                   | PROGRESS      |
 * | "photon transport completed in t seconds"          | EXTRA         |
 * | "... cells ... converged ..."                      | EXTRA         |
 * | "p per cent of n photons transported"              | EXTRA_TRANSPORT |
 *
 * At Verbosity::ALL every line is echoed unmodified. Independently of the
 * verbosity, keep_going is false exactly for lines containing
 * CONVERGENCE_STATISTICS_MARKER.
 *
 * @param line Raw output line without its trailing newline
 * @param n_cores Number of parallel processes; each reports its own photon count
 * @param verbosity Console verbosity
 * @param now Wall-clock time used for the cycle start time stamps
 * @return Lines to print and whether to keep reading the output
 */
Classification classifyLine(const std::string& line, size_t n_cores, Verbosity verbosity, std::time_t now);

/**
 * @brief LineClassifier for the radiative-transfer simulation, see classifyLine().
 */
class SimulationOutputClassifier : public LineClassifier {
 private:
  size_t n_cores; ///< Number of parallel processes reporting photon counts
  Verbosity verbosity; ///< Console verbosity
  std::function<std::time_t()> clock; ///< Source of the wall-clock time stamps

 public:
  static const std::string CONVERGENCE_STATISTICS_MARKER;

  SimulationOutputClassifier(size_t n_cores, Verbosity verbosity,
                             std::function<std::time_t()> clock = [] { return std::time(nullptr); });

  Classification classify(const std::string& line) const override;
};
