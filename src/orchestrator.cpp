#include "orchestrator.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>

#include "config_defaults.hpp"

namespace {

const std::string DELIMITER(72, '-');

RunState runStateFor(ConvergenceState state) {
  switch (state) {
    case ConvergenceState::CONVERGED:
      return RunState::CONVERGED;
    case ConvergenceState::NOT_CONVERGED:
      return RunState::NOT_CONVERGED;
    case ConvergenceState::AMBIGUOUS:
      return RunState::AMBIGUOUS;
    case ConvergenceState::NO_INFORMATION:
      return RunState::NO_INFORMATION;
  }
  return RunState::AMBIGUOUS;
}

std::string formatValue(double value) {
  std::ostringstream ss;
  ss << value;
  return ss.str();
}

} // namespace

size_t BatchResult::failedCount() const {
  size_t count = 0;
  for (const auto& outcome : outcomes) {
    if (outcome.failed()) count++;
  }
  return count;
}

int BatchResult::exitStatus() const {
  return static_cast<int>(std::min<size_t>(failedCount(), MAX_EXIT_STATUS));
}

RunOrchestrator::RunOrchestrator(const Config& config_, const Logger& logger_, SimulationRunner& runner_,
                                 ConfigMutator& mutator_, const ConvergenceEvaluator& evaluator_)
    : config(config_), logger(logger_), runner(runner_), mutator(mutator_), evaluator(evaluator_) {}

RunResult RunOrchestrator::launch(const Model& model, const RunInvocation& invocation) {
  try {
    return runner.run(model, invocation);
  } catch (const std::runtime_error& e) {
    logger.error("Could not run " + model.name() + ": " + e.what());
    RunResult failed;
    failed.exit_code = -1;
    return failed;
  }
}

ModelOutcome RunOrchestrator::runModel(const Model& model) {
  ModelOutcome outcome;
  outcome.model = model;
  outcome.states.push_back(RunState::NOT_STARTED);

  logger.log(DELIMITER);
  logger.log("Model " + model.name());
  logger.log(DELIMITER);

  bool split = config.getSplitCyclesEnabled();
  try {
    if (split) {
      // A backup left by an earlier batch holds the original, never replace it
      bool keep_backup = mutator.hasBackup(model.parameterFile());
      if (keep_backup) {
        logger.warning("Keeping existing backup " + ParameterFile::backupPath(model.parameterFile()).string() +
                       " from an earlier run as the original parameter file");
      }
      mutator.set(model.parameterFile(), ConfigDefaults::KEY_SPECTRUM_CYCLES, "0", !keep_backup);
    }

    outcome.states.push_back(RunState::PRIMARY_RUN);
    outcome.result = launch(model, RunInvocation::fromConfig(config));

    if (outcome.result.exit_code == 0) {
      evaluateConvergence(model, outcome);
      if (split && outcome.convergence == ConvergenceState::CONVERGED) {
        restartForSpectra(model, outcome);
      }
    }
  } catch (const std::runtime_error& e) {
    logger.error("Failed to run " + model.name() + ": " + e.what());
    outcome.result.exit_code = -1;
  }

  if (split) {
    restoreParameterFile(model, outcome);
  }

  try {
    outcome.errors = tallyErrors(model);
  } catch (const std::runtime_error& e) {
    logger.warning("Could not read the error summary of " + model.name() + ": " + e.what());
  }
  reportErrors(outcome);

  outcome.states.push_back(RunState::DONE);

  logger.log(DELIMITER);
  std::string status = outcome.failed() ? "FAILED with exit code " + std::to_string(outcome.result.exit_code)
                                        : "finished";
  logger.log("Model " + model.name() + " " + status);
  logger.log(DELIMITER);

  return outcome;
}

void RunOrchestrator::evaluateConvergence(const Model& model, ModelOutcome& outcome) {
  ConvergenceReport report;
  try {
    report = evaluator.evaluate(model);
  } catch (const DiagnosticNotFound& e) {
    logger.warning("No convergence information for " + model.name() + ": " + e.what());
    outcome.convergence = ConvergenceState::NO_INFORMATION;
    outcome.states.push_back(RunState::NO_INFORMATION);
    return;
  }

  ConvergenceState state = classifyConvergence(report, config.getConvergenceThreshold());
  outcome.convergence = state;
  outcome.states.push_back(runStateFor(state));

  if (report.empty()) {
    logger.warning("Model convergence: no convergence cycles found for " + model.name());
    return;
  }

  outcome.convergence_value = report.last();
  logger.log("Model convergence: " + formatValue(report.last()));
  if (state == ConvergenceState::AMBIGUOUS) {
    logger.warning("Mysterious convergence value " + formatValue(report.last()) + " for " + model.name() +
                   ", treating the model as not converged");
  } else if (state == ConvergenceState::NOT_CONVERGED) {
    logger.log("Model has not converged, threshold is " + formatValue(config.getConvergenceThreshold()));
  }
}

void RunOrchestrator::restartForSpectra(const Model& model, ModelOutcome& outcome) {
  const SplitCycleSettings& settings = config.getSplitCycles();
  outcome.restarted = true;

  mutator.set(model.parameterFile(), ConfigDefaults::KEY_PHOTONS_PER_CYCLE, settings.photons_per_cycle, false);
  mutator.set(model.parameterFile(), ConfigDefaults::KEY_SPECTRUM_CYCLES, settings.spectrum_cycles, false);

  logger.log("Restarting " + model.name() + " for " + settings.spectrum_cycles + " spectrum cycles");
  outcome.states.push_back(RunState::RESTART_RUN);

  RunInvocation invocation = RunInvocation::fromConfig(config);
  invocation.resume = true;
  outcome.result = launch(model, invocation);
}

void RunOrchestrator::restoreParameterFile(const Model& model, const ModelOutcome& outcome) {
  if (config.getSplitCycles().restore_policy == RestorePolicy::AFTER_RESTART && !outcome.restarted) {
    if (mutator.hasBackup(model.parameterFile())) {
      logger.log("Leaving " + model.parameterFile().string() + " with " + ConfigDefaults::KEY_SPECTRUM_CYCLES +
                 " 0, the original is in " + ParameterFile::backupPath(model.parameterFile()).string());
    }
    return;
  }

  if (!mutator.hasBackup(model.parameterFile())) {
    return;
  }
  try {
    mutator.restore(model.parameterFile());
  } catch (const std::runtime_error& e) {
    logger.error("Could not restore " + model.parameterFile().string() + ": " + e.what());
  }
}

void RunOrchestrator::reportErrors(const ModelOutcome& outcome) const {
  if (outcome.errors.empty()) {
    return;
  }
  logger.log("Errors reported by the simulation:");
  for (const auto& [message, count] : outcome.errors) {
    logger.log("  " + std::to_string(count) + " -- " + message);
  }
}

BatchResult RunOrchestrator::runBatch(const std::vector<Model>& models) {
  BatchResult batch;
  for (const auto& model : models) {
    batch.outcomes.push_back(runModel(model));
  }

  size_t failed = batch.failedCount();
  if (failed == 0) {
    logger.log("All " + std::to_string(models.size()) + " model(s) ran successfully");
    return batch;
  }

  logger.error(std::to_string(failed) + " of " + std::to_string(models.size()) + " model(s) failed:");
  for (const auto& outcome : batch.outcomes) {
    if (outcome.failed()) {
      logger.error("  " + outcome.model.name() + " (exit code " + std::to_string(outcome.result.exit_code) + ")");
    }
  }
  return batch;
}
