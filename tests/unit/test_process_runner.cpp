#include <gtest/gtest.h>
#include <unistd.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <string>

#include "defs.hpp"
#include "logger.hpp"
#include "model.hpp"
#include "output_classifier.hpp"
#include "process_runner.hpp"
#include "util.hpp"

namespace fs = std::filesystem;

class ProcessRunnerTest : public ::testing::Test {
 protected:
  fs::path dir;
  Model model;
  RunInvocation invocation;

  std::ostringstream out;
  std::ostringstream err;
  Logger logger = Logger(out, err);
  SimulationOutputClassifier classifier = SimulationOutputClassifier(1, Verbosity::PROGRESS, [] {
    return std::time_t(1700000000);
  });

  void SetUp() override {
    dir = fs::temp_directory_path() /
          ("simrun_runner_" + std::to_string(getpid()) + "_" +
           ::testing::UnitTest::GetInstance()->current_test_info()->name());
    fs::remove_all(dir);
    fs::create_directories(dir);

    model.root = "cv";
    model.directory = dir;

    invocation.binary = "py";
    invocation.setup_command = "";
    invocation.data_dir = "data";
    invocation.restart_marker = ".wind_save";
    invocation.use_parallel = false;
    invocation.n_cores = 1;
    invocation.launcher = "mpirun -n";
    invocation.resume = false;
    invocation.auto_restart = true;
  }

  void TearDown() override { fs::remove_all(dir); }

  // Uses a shell script in place of the simulation
  void fakeSimulation(const std::string& script) {
    fs::path path = dir / "fake_py.sh";
    std::ofstream(path) << script;
    invocation.binary = "sh " + shellQuote(path.string());
  }

  std::string read(const fs::path& path) {
    std::ifstream in(path);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
  }

  RunResult run() {
    ProcessRunner runner(logger, classifier);
    return runner.run(model, invocation);
  }
};

TEST_F(ProcessRunnerTest, CommandWithSetupLauncherAndFlags) {
  invocation.setup_command = "Setup_Py_Dir";
  invocation.use_parallel = true;
  invocation.n_cores = 4;
  invocation.flags = {"-p", "2"};

  EXPECT_EQ(buildCommand(model, invocation),
            "cd '" + dir.string() + "'; Setup_Py_Dir; mpirun -n 4 py -p 2 cv.pf");
}

TEST_F(ProcessRunnerTest, CommandSkipsSetupWhenDataExists) {
  invocation.setup_command = "Setup_Py_Dir";
  fs::create_directories(dir / "data");
  EXPECT_EQ(buildCommand(model, invocation), "cd '" + dir.string() + "'; py cv.pf");
}

TEST_F(ProcessRunnerTest, CommandResumeFlag) {
  invocation.resume = true;
  EXPECT_EQ(buildCommand(model, invocation), "cd '" + dir.string() + "'; py -r cv.pf");
}

TEST_F(ProcessRunnerTest, CommandResumesFromSavedState) {
  std::ofstream(dir / "cv.wind_save") << "saved";
  EXPECT_EQ(buildCommand(model, invocation), "cd '" + dir.string() + "'; py -r cv.pf");

  invocation.auto_restart = false;
  EXPECT_EQ(buildCommand(model, invocation), "cd '" + dir.string() + "'; py cv.pf");
}

TEST_F(ProcessRunnerTest, RunCapturesAndClassifiesOutput) {
  fakeSimulation(
      "echo \"!!Python: Beginning cycle 1 of 2 for defining wind\"\n"
      "echo \"args: $*\"\n"
      "echo \"Completed ionization cycle 1 :  The elapsed TIME was 61.5\"\n");

  RunResult result = run();
  EXPECT_EQ(result.exit_code, 0);
  ASSERT_EQ(result.lines.size(), 3);
  EXPECT_EQ(result.lines[1], "args: cv.pf");
  EXPECT_TRUE(result.error_lines.empty());

  std::string console = out.str();
  EXPECT_NE(console.find("Running: cd '" + dir.string() + "'; sh "), std::string::npos);
  EXPECT_NE(console.find("] Starting Ionization Cycle 1/2"), std::string::npos);
  EXPECT_NE(console.find("Elapsed run time 0:01:01 hrs:mins:secs"), std::string::npos);
  EXPECT_EQ(console.find("args:"), std::string::npos);

  std::string run_log = read(model.runLog());
  EXPECT_NE(run_log.find("args: cv.pf\n"), std::string::npos);
  EXPECT_NE(run_log.find("Completed ionization cycle 1"), std::string::npos);
}

TEST_F(ProcessRunnerTest, RunLogIsAppended) {
  std::ofstream(model.runLog()) << "earlier run\n";
  fakeSimulation("echo second run\n");
  run();

  std::string run_log = read(model.runLog());
  EXPECT_EQ(run_log.rfind("earlier run\n", 0), 0);
  EXPECT_NE(run_log.find("second run\n"), std::string::npos);
}

TEST_F(ProcessRunnerTest, NonZeroExitIsRecorded) {
  fakeSimulation("echo \"something went wrong\" >&2\nexit 3\n");

  RunResult result = run();
  EXPECT_EQ(result.exit_code, 3);
  ASSERT_EQ(result.error_lines.size(), 1);
  EXPECT_EQ(result.error_lines[0], "something went wrong");
  EXPECT_NE(err.str().find("ERROR: Simulation exited with non-zero exit code 3"), std::string::npos);
  EXPECT_NE(read(model.runLog()).find("something went wrong\n"), std::string::npos);
}

TEST_F(ProcessRunnerTest, KilledBySignal) {
  fakeSimulation("kill -9 $$\n");
  RunResult result = run();
  EXPECT_EQ(result.exit_code, 128 + 9);
}

TEST_F(ProcessRunnerTest, StopsClassifyingAfterConvergenceStatistics) {
  fakeSimulation(
      "echo \"!!Python: Beginning cycle 1 of 2 for defining wind\"\n"
      "echo \"!!Python: Convergence statistics for the wind after the ionization calculation:\"\n"
      "echo \"!!Python: Beginning cycle 2 of 2 for defining wind\"\n"
      "echo after the marker\n");

  RunResult result = run();
  EXPECT_EQ(result.exit_code, 0);
  EXPECT_EQ(result.lines.size(), 4);

  std::string console = out.str();
  EXPECT_NE(console.find("Starting Ionization Cycle 1/2"), std::string::npos);
  EXPECT_EQ(console.find("Starting Ionization Cycle 2/2"), std::string::npos);

  std::string run_log = read(model.runLog());
  EXPECT_NE(run_log.find("Beginning cycle 2 of 2"), std::string::npos);
  EXPECT_NE(run_log.find("after the marker\n"), std::string::npos);
}

TEST_F(ProcessRunnerTest, LargeOutputOnBothStreamsDoesNotBlock) {
  // Fill stderr far beyond the pipe capacity before writing to stdout
  fakeSimulation(
      "seq 1 200000 >&2\n"
      "seq 1 200000\n"
      "echo last line without newline | tr -d '\\n'\n");

  RunResult result = run();
  EXPECT_EQ(result.exit_code, 0);
  ASSERT_EQ(result.lines.size(), 200001);
  EXPECT_EQ(result.lines[199999], "200000");
  EXPECT_EQ(result.lines.back(), "last line without newline");
  EXPECT_EQ(result.error_lines.size(), 200000);
}

TEST_F(ProcessRunnerTest, SetupRunsWhenDataDirectoryMissing) {
  invocation.setup_command = "touch setup_ran";
  fakeSimulation("exit 0\n");
  run();
  EXPECT_TRUE(fs::exists(dir / "setup_ran"));
}

TEST_F(ProcessRunnerTest, MissingModelDirectoryThrows) {
  model.directory = dir / "missing";
  fakeSimulation("exit 0\n");
  ProcessRunner runner(logger, classifier);
  EXPECT_THROW(runner.run(model, invocation), std::runtime_error);
}

TEST_F(ProcessRunnerTest, InvocationFromConfig) {
  ConfigOverrides overrides;
  overrides.n_cores = 3;
  overrides.resume = true;
  Config config = Config::fromTomlString("flags = [\"-z\"]", logger, overrides);

  RunInvocation from_config = RunInvocation::fromConfig(config);
  EXPECT_EQ(from_config.binary, "py");
  EXPECT_EQ(from_config.setup_command, "Setup_Py_Dir");
  EXPECT_TRUE(from_config.use_parallel);
  EXPECT_EQ(from_config.n_cores, 3);
  EXPECT_TRUE(from_config.resume);
  EXPECT_EQ(from_config.flags, std::vector<std::string>{"-z"});
}
