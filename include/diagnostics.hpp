#pragma once

#include <filesystem>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

#include "defs.hpp"
#include "model.hpp"

/**
 * @brief Per-cycle convergence of a model, read from its diagnostic output.
 */
struct ConvergenceReport {
  std::vector<double> converged; ///< Fraction of converged cells per cycle
  std::vector<double> converging; ///< Fraction of still converging cells per cycle

  bool empty() const { return converged.empty(); }

  /**
   * @brief Converged fraction of the most recent cycle; the report must not be empty.
   */
  double last() const { return converged.back(); }
};

/**
 * @brief Error message to number of occurrences, from the simulation's error summary.
 */
using ErrorTally = std::map<std::string, long>;

/**
 * @brief Thrown when a model has no diagnostic file, e.g. it never ran.
 */
class DiagnosticNotFound : public std::runtime_error {
 public:
  explicit DiagnosticNotFound(const std::filesystem::path& path)
      : std::runtime_error("No diagnostic file " + path.string()) {}
};

/**
 * @brief Interface for obtaining the convergence of a model after a run.
 */
class ConvergenceEvaluator {
 public:
  virtual ~ConvergenceEvaluator() = default;

  /**
   * @brief Reads the per-cycle convergence of a model.
   *
   * @throws DiagnosticNotFound if no diagnostic output exists
   */
  virtual ConvergenceReport evaluate(const Model& model) const = 0;
};

/**
 * @brief ConvergenceEvaluator reading the diagnostic file of the master process.
 *
 * Parses "<dir>/diag_<root>/<root>_0.diag" for lines of the form
 *
 *     !!Check_converging: <n> (<f>) converged and <m> (<g>) converging of <k> cells
 *
 * taking f and g for each cycle. Lines with a different number of tokens are
 * skipped. A fraction that does not parse is recorded as -1, which callers
 * see as a value outside [0, 1].
 */
class DiagnosticConvergenceEvaluator : public ConvergenceEvaluator {
 public:
  ConvergenceReport evaluate(const Model& model) const override;

  static std::filesystem::path diagnosticFile(const Model& model);

  /**
   * @brief Parses convergence lines from the contents of a diagnostic file.
   */
  static ConvergenceReport parse(const std::string& content);
};

/**
 * @brief Decides the convergence state of a report.
 *
 * The last cycle decides: outside [0, 1] (or an empty report) is AMBIGUOUS,
 * at or above the threshold is CONVERGED, anything else NOT_CONVERGED.
 */
ConvergenceState classifyConvergence(const ConvergenceReport& report, double threshold);

/**
 * @brief Sums the error summaries of all diagnostic files of a model.
 *
 * Every "<root>_*.diag" file in the model's diag directory is scanned for the
 * table following "Recurrences --  Description", whose lines read
 * "<count> -- <message>". Returns an empty tally when there are no files.
 */
ErrorTally tallyErrors(const Model& model);

/**
 * @brief Parses the error summary table from the contents of one diagnostic file.
 */
ErrorTally parseErrorSummary(const std::string& content);
