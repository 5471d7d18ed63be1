#include <sstream>
#include <stdexcept>
#include <vector>

#include "config.hpp"
#include "diagnostics.hpp"
#include "logger.hpp"
#include "model.hpp"
#include "orchestrator.hpp"
#include "output_classifier.hpp"
#include "parameter_file.hpp"
#include "process_runner.hpp"
#include "util.hpp"

int main(int argc, char** argv) {
  ParsedArgs args = parseArguments(argc, argv);
  Logger logger(args.quietmode);

  try {
    Config config = args.config_filename.has_value()
                        ? Config::fromFile(*args.config_filename, logger, args.overrides)
                        : Config::fromTomlString("", logger, args.overrides);

    std::stringstream config_log;
    config.printConfig(config_log);
    logger.log(config_log.str());

    std::vector<Model> models = discoverModels(config.getSearchDir());
    if (models.empty()) {
      logger.error("No parameter files found in " + config.getSearchDir());
      return 1;
    }
    logger.log("Found " + std::to_string(models.size()) + " model(s) in " + config.getSearchDir());

    SimulationOutputClassifier classifier(config.getNCores(), config.getVerbosity());
    ProcessRunner runner(logger, classifier);
    ParameterFile parameter_files;
    DiagnosticConvergenceEvaluator evaluator;

    RunOrchestrator orchestrator(config, logger, runner, parameter_files, evaluator);
    BatchResult batch = orchestrator.runBatch(models);
    return batch.exitStatus();
  } catch (const std::runtime_error& e) {
    logger.error(e.what());
    return 1;
  }
}
