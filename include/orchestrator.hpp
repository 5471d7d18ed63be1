#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "config.hpp"
#include "defs.hpp"
#include "diagnostics.hpp"
#include "logger.hpp"
#include "model.hpp"
#include "parameter_file.hpp"
#include "process_runner.hpp"

/**
 * @brief Everything recorded about one model of a batch.
 */
struct ModelOutcome {
  Model model; ///< The model that was run
  RunResult result; ///< Result of the last invocation that was executed
  std::optional<ConvergenceState> convergence; ///< Unset if convergence was not evaluated
  std::optional<double> convergence_value; ///< Converged fraction of the last cycle, if any
  ErrorTally errors; ///< Error summary of the model's diagnostic files
  bool restarted = false; ///< True if the split-cycle restart was entered
  std::vector<RunState> states; ///< States visited, ending in DONE

  bool failed() const { return result.exit_code != 0; }
};

/**
 * @brief Outcomes of a batch of models, in the order they were run.
 */
struct BatchResult {
  std::vector<ModelOutcome> outcomes;

  /**
   * @brief Number of models whose last invocation exited non-zero.
   */
  size_t failedCount() const;

  /**
   * @brief Process exit status for the batch: the failed count, capped at MAX_EXIT_STATUS.
   *
   * Exit statuses are truncated to 8 bits, so larger counts would wrap to 0.
   */
  int exitStatus() const;

  static constexpr int MAX_EXIT_STATUS = 255;
};

/**
 * @brief Runs models one after another and drives the split-cycle state machine.
 *
 * For each model:
 *   1. In split-cycle mode, back up the parameter file and set the spectrum
 *      cycles to 0, so the primary run only computes the ionization state.
 *   2. Run the simulation. A non-zero exit code ends the model.
 *   3. Evaluate the convergence of the last ionization cycle.
 *   4. In split-cycle mode, a converged model is restarted with the restart
 *      photon count and spectrum cycles to compute the spectra.
 *   5. Restore the parameter file according to the restore policy.
 *
 * Per-model failures, including launch failures, are recorded in the outcome
 * and never stop the batch.
 */
class RunOrchestrator {
 private:
  const Config& config; ///< Run configuration
  const Logger& logger; ///< Console logger
  SimulationRunner& runner; ///< Launches the simulation
  ConfigMutator& mutator; ///< Edits the parameter files
  const ConvergenceEvaluator& evaluator; ///< Reads the convergence after a run

 public:
  RunOrchestrator(const Config& config, const Logger& logger, SimulationRunner& runner, ConfigMutator& mutator,
                  const ConvergenceEvaluator& evaluator);

  ModelOutcome runModel(const Model& model);

  /**
   * @brief Runs all models and logs a summary naming every failed model.
   */
  BatchResult runBatch(const std::vector<Model>& models);

 private:
  /* Runs the simulation once, recording a launch failure as exit code -1 */
  RunResult launch(const Model& model, const RunInvocation& invocation);

  void evaluateConvergence(const Model& model, ModelOutcome& outcome);
  void restartForSpectra(const Model& model, ModelOutcome& outcome);
  void restoreParameterFile(const Model& model, const ModelOutcome& outcome);
  void reportErrors(const ModelOutcome& outcome) const;
};
