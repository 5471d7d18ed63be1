#include <gtest/gtest.h>

#include <limits>
#include <sstream>
#include <string>
#include <vector>

#include "config.hpp"
#include "defs.hpp"

class ConfigTest : public ::testing::Test {
 protected:
  std::ostringstream out;
  std::ostringstream err;
  Logger logger = Logger(out, err);
  Logger console_logger = Logger(); // death tests match on the real stderr
};

TEST_F(ConfigTest, ApplyDefaults) {
  Config config = Config::fromTomlString("", logger);

  EXPECT_EQ(config.getBinary(), "py");
  EXPECT_TRUE(config.getFlags().empty());
  EXPECT_EQ(config.getSetupCommand(), "Setup_Py_Dir");
  EXPECT_EQ(config.getDataDir(), "data");
  EXPECT_EQ(config.getRestartMarker(), ".wind_save");
  EXPECT_EQ(config.getSearchDir(), ".");
  EXPECT_EQ(config.getVerbosity(), Verbosity::PROGRESS);
  EXPECT_FALSE(config.getResume());
  EXPECT_TRUE(config.getAutoRestart());
  EXPECT_DOUBLE_EQ(config.getConvergenceThreshold(), 0.80);

  EXPECT_FALSE(config.getParallel().enabled);
  EXPECT_EQ(config.getNCores(), 1);
  EXPECT_EQ(config.getParallel().launcher, "mpirun -n");

  EXPECT_FALSE(config.getSplitCyclesEnabled());
  EXPECT_EQ(config.getSplitCycles().photons_per_cycle, "1e6");
  EXPECT_EQ(config.getSplitCycles().spectrum_cycles, "5");
  EXPECT_EQ(config.getSplitCycles().restore_policy, RestorePolicy::ALWAYS);
}

TEST_F(ConfigTest, ParseBasicSettings) {
  Config config = Config::fromTomlString(
      R"(
        binary = "py87"
        flags = ["-p", "2"]
        search_dir = "models"
        verbosity = "transport"
        resume = true
        auto_restart = false
        convergence_threshold = 0.9
      )",
      logger);

  EXPECT_EQ(config.getBinary(), "py87");
  EXPECT_EQ(config.getFlags(), (std::vector<std::string>{"-p", "2"}));
  EXPECT_EQ(config.getSearchDir(), "models");
  EXPECT_EQ(config.getVerbosity(), Verbosity::EXTRA_TRANSPORT);
  EXPECT_TRUE(config.getResume());
  EXPECT_FALSE(config.getAutoRestart());
  EXPECT_DOUBLE_EQ(config.getConvergenceThreshold(), 0.9);
}

TEST_F(ConfigTest, ParseStructSettings) {
  Config config = Config::fromTomlString(
      R"(
        parallel = { enabled = true, cores = 8, launcher = "srun -n" }

        [split_cycles]
        enabled = true
        photons_per_cycle = "5e6"
        spectrum_cycles = "10"
        restore_policy = "after_restart"
      )",
      logger);

  EXPECT_TRUE(config.getParallel().enabled);
  EXPECT_EQ(config.getNCores(), 8);
  EXPECT_EQ(config.getParallel().launcher, "srun -n");

  EXPECT_TRUE(config.getSplitCyclesEnabled());
  EXPECT_EQ(config.getSplitCycles().photons_per_cycle, "5e6");
  EXPECT_EQ(config.getSplitCycles().spectrum_cycles, "10");
  EXPECT_EQ(config.getSplitCycles().restore_policy, RestorePolicy::AFTER_RESTART);
}

TEST_F(ConfigTest, CoresIgnoredWhenParallelDisabled) {
  Config config = Config::fromTomlString("parallel = { enabled = false, cores = 8 }", logger);
  EXPECT_EQ(config.getNCores(), 1);
}

TEST_F(ConfigTest, CommandLineOverridesWin) {
  ConfigOverrides overrides;
  overrides.search_dir = "elsewhere";
  overrides.flags = std::vector<std::string>{"-z"};
  overrides.verbosity = Verbosity::ALL;
  overrides.resume = false;
  overrides.auto_restart = false;
  overrides.split_cycles = true;
  overrides.n_cores = 4;
  overrides.convergence_threshold = 0.5;

  Config config = Config::fromTomlString(
      R"(
        search_dir = "models"
        flags = ["-p", "2"]
        verbosity = "silent"
        convergence_threshold = 0.9
      )",
      logger, overrides);

  EXPECT_EQ(config.getSearchDir(), "elsewhere");
  EXPECT_EQ(config.getFlags(), std::vector<std::string>{"-z"});
  EXPECT_EQ(config.getVerbosity(), Verbosity::ALL);
  EXPECT_FALSE(config.getAutoRestart());
  EXPECT_TRUE(config.getSplitCyclesEnabled());
  EXPECT_TRUE(config.getParallel().enabled);
  EXPECT_EQ(config.getNCores(), 4);
  EXPECT_DOUBLE_EQ(config.getConvergenceThreshold(), 0.5);
}

TEST_F(ConfigTest, SingleCoreOverrideDisablesParallel) {
  ConfigOverrides overrides;
  overrides.n_cores = 1;
  Config config = Config::fromTomlString("parallel = { enabled = true, cores = 8 }", logger, overrides);
  EXPECT_FALSE(config.getParallel().enabled);
  EXPECT_EQ(config.getNCores(), 1);
}

TEST_F(ConfigTest, ResumeWithSplitCyclesWarns) {
  Config config = Config::fromTomlString(
      R"(
        resume = true
        split_cycles = { enabled = true }
      )",
      logger);
  EXPECT_TRUE(config.getResume());
  EXPECT_NE(err.str().find("WARNING: resume is set together with split cycles"), std::string::npos);
}

TEST_F(ConfigTest, PrintedConfigParsesBack) {
  Config config = Config::fromTomlString(
      R"(
        binary = "py87"
        flags = ["-p", "2"]
        verbosity = "extra"
        parallel = { enabled = true, cores = 3 }
        split_cycles = { enabled = true, restore_policy = "after_restart" }
      )",
      logger);

  std::stringstream printed;
  config.printConfig(printed);

  Config reparsed = Config::fromTomlString(printed.str(), logger);
  EXPECT_EQ(reparsed.getBinary(), "py87");
  EXPECT_EQ(reparsed.getFlags(), config.getFlags());
  EXPECT_EQ(reparsed.getVerbosity(), Verbosity::EXTRA);
  EXPECT_EQ(reparsed.getNCores(), 3);
  EXPECT_TRUE(reparsed.getSplitCyclesEnabled());
  EXPECT_EQ(reparsed.getSplitCycles().restore_policy, RestorePolicy::AFTER_RESTART);
}

TEST_F(ConfigTest, PrintedConfigEscapesStrings) {
  ConfigOverrides overrides;
  overrides.search_dir = "C:\\models \"grid\"";
  overrides.flags = std::vector<std::string>{"-p", "say \"hi\""};
  Config config = Config::fromTomlString("parallel = { enabled = true, cores = 2, launcher = 'srun \\ -n' }",
                                         logger, overrides);

  std::stringstream printed;
  config.printConfig(printed);

  Config reparsed = Config::fromTomlString(printed.str(), logger);
  EXPECT_EQ(reparsed.getSearchDir(), "C:\\models \"grid\"");
  EXPECT_EQ(reparsed.getFlags(), (std::vector<std::string>{"-p", "say \"hi\""}));
  EXPECT_EQ(reparsed.getParallel().launcher, "srun \\ -n");
}

TEST_F(ConfigTest, ThresholdOutOfRange) {
  ASSERT_DEATH({
    Config config = Config::fromTomlString("convergence_threshold = 1.5", console_logger);
  }, "ERROR: Validation error for field 'convergence_threshold': must be <= 1");
}

TEST_F(ConfigTest, ThresholdOverrideOutOfRange) {
  ConfigOverrides overrides;
  overrides.convergence_threshold = -0.1;
  ASSERT_DEATH({
    Config config = Config::fromTomlString("", console_logger, overrides);
  }, "ERROR: convergence_threshold must be within \\[0, 1\\]");
}

TEST_F(ConfigTest, ThresholdNotANumber) {
  ASSERT_DEATH({
    Config config = Config::fromTomlString("convergence_threshold = nan", console_logger);
  }, "ERROR: convergence_threshold must be within \\[0, 1\\]");
}

TEST_F(ConfigTest, ThresholdOverrideNotANumber) {
  ConfigOverrides overrides;
  overrides.convergence_threshold = std::numeric_limits<double>::quiet_NaN();
  ASSERT_DEATH({
    Config config = Config::fromTomlString("", console_logger, overrides);
  }, "ERROR: convergence_threshold must be within \\[0, 1\\]");
}

TEST_F(ConfigTest, UnknownVerbosity) {
  ASSERT_DEATH({
    Config config = Config::fromTomlString("verbosity = \"loud\"", console_logger);
  }, "ERROR: Unknown verbosity level: loud");
}

TEST_F(ConfigTest, WrongType) {
  ASSERT_DEATH({
    Config config = Config::fromTomlString("resume = \"yes\"", console_logger);
  }, "ERROR: Validation error for field 'resume': wrong type \\(expected boolean\\)");
}

TEST_F(ConfigTest, ParallelUnknownKey) {
  ASSERT_DEATH({
    Config config = Config::fromTomlString("parallel = { enabled = true, nodes = 2 }", console_logger);
  }, "ERROR: Validation error for field 'parallel': unknown key 'nodes'");
}

TEST_F(ConfigTest, ParallelZeroCores) {
  ASSERT_DEATH({
    Config config = Config::fromTomlString("parallel = { enabled = true, cores = 0 }", console_logger);
  }, "ERROR: Validation error for field 'cores': must be > 0");
}

TEST_F(ConfigTest, UnknownRestorePolicy) {
  ASSERT_DEATH({
    Config config = Config::fromTomlString("split_cycles = { restore_policy = \"never\" }", console_logger);
  }, "ERROR: Validation error for field 'restore_policy': unknown policy 'never'");
}

TEST_F(ConfigTest, ZeroSpectrumCyclesForRestart) {
  ASSERT_DEATH({
    Config config = Config::fromTomlString("split_cycles = { enabled = true, spectrum_cycles = \"0\" }", console_logger);
  }, "ERROR: split_cycles.spectrum_cycles must be non-zero");
}

TEST_F(ConfigTest, EmptyBinary) {
  ASSERT_DEATH({
    Config config = Config::fromTomlString("binary = \"\"", console_logger);
  }, "ERROR: binary cannot be empty");
}

TEST_F(ConfigTest, InvalidToml) {
  ASSERT_DEATH({
    Config config = Config::fromTomlString("binary = ", console_logger);
  }, "ERROR: Failed to parse configuration");
}
