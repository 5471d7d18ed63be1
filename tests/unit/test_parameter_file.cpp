#include <gtest/gtest.h>
#include <unistd.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>

#include "parameter_file.hpp"

namespace fs = std::filesystem;

class ParameterFileTest : public ::testing::Test {
 protected:
  fs::path dir;
  fs::path pf;
  ParameterFile parameter_file;

  const std::string original =
      "# Parameter file for a cataclysmic variable\n"
      "System_type(star,cv,bh,agn,previous)                   cv\n"
      "Photons_per_cycle                                      100000\n"
      "Ionization_cycles                                      20\n"
      "Spectrum_cycles                                        20 # five is enough\n"
      "Wind.radmax(cm)                                        1e11\n";

  void SetUp() override {
    dir = fs::temp_directory_path() /
          ("simrun_pf_" + std::to_string(getpid()) + "_" +
           ::testing::UnitTest::GetInstance()->current_test_info()->name());
    fs::remove_all(dir);
    fs::create_directories(dir);
    pf = dir / "cv.pf";
    write(pf, original);
  }

  void TearDown() override { fs::remove_all(dir); }

  static void write(const fs::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary);
    out << content;
  }

  static std::string read(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
  }
};

TEST_F(ParameterFileTest, SetReplacesValueOnly) {
  parameter_file.set(pf, "Spectrum_cycles", "0", false);

  EXPECT_EQ(ParameterFile::get(pf, "Spectrum_cycles"), "0");
  EXPECT_NE(read(pf).find("Spectrum_cycles                                        0 # five is enough\n"),
            std::string::npos);
  EXPECT_EQ(ParameterFile::get(pf, "Photons_per_cycle"), "100000");
  EXPECT_FALSE(parameter_file.hasBackup(pf));
}

TEST_F(ParameterFileTest, SetMatchesKeyWithUnits) {
  parameter_file.set(pf, "System_type", "agn", false);
  EXPECT_EQ(ParameterFile::get(pf, "System_type"), "agn");

  parameter_file.set(pf, "Wind.radmax", "2e11", false);
  EXPECT_EQ(ParameterFile::get(pf, "Wind.radmax(cm)"), "2e11");
}

TEST_F(ParameterFileTest, SetDoesNotMatchKeyPrefix) {
  write(pf, "Photons_per_cycle_extra 5\nPhotons_per_cycle 10\n");
  parameter_file.set(pf, "Photons_per_cycle", "1e6", false);
  EXPECT_EQ(read(pf), "Photons_per_cycle_extra 5\nPhotons_per_cycle 1e6\n");
}

TEST_F(ParameterFileTest, SetIgnoresComments) {
  write(pf, "# Spectrum_cycles 3\nSpectrum_cycles 3\n");
  parameter_file.set(pf, "Spectrum_cycles", "0", false);
  EXPECT_EQ(read(pf), "# Spectrum_cycles 3\nSpectrum_cycles 0\n");
}

TEST_F(ParameterFileTest, SetKeyWithoutValue) {
  write(pf, "Spectrum_cycles\n");
  parameter_file.set(pf, "Spectrum_cycles", "5", false);
  EXPECT_EQ(read(pf), "Spectrum_cycles 5\n");
}

TEST_F(ParameterFileTest, SetMissingKeyThrowsAndLeavesFile) {
  EXPECT_THROW(parameter_file.set(pf, "No_such_key", "1", true), std::runtime_error);
  EXPECT_EQ(read(pf), original);
  EXPECT_FALSE(parameter_file.hasBackup(pf));
}

TEST_F(ParameterFileTest, SetMissingFileThrows) {
  EXPECT_THROW(parameter_file.set(dir / "missing.pf", "Spectrum_cycles", "0", false), std::runtime_error);
}

TEST_F(ParameterFileTest, BackupAndRestoreIsByteIdentical) {
  parameter_file.set(pf, "Spectrum_cycles", "0", true);
  ASSERT_TRUE(parameter_file.hasBackup(pf));
  EXPECT_EQ(read(ParameterFile::backupPath(pf)), original);

  parameter_file.set(pf, "Photons_per_cycle", "1e6", false);
  parameter_file.set(pf, "Spectrum_cycles", "5", false);
  EXPECT_NE(read(pf), original);

  parameter_file.restore(pf);
  EXPECT_EQ(read(pf), original);
  EXPECT_FALSE(parameter_file.hasBackup(pf));
}

TEST_F(ParameterFileTest, BackupOverwritesOlderBackup) {
  write(ParameterFile::backupPath(pf), "stale\n");
  parameter_file.set(pf, "Spectrum_cycles", "0", true);
  EXPECT_EQ(read(ParameterFile::backupPath(pf)), original);
}

TEST_F(ParameterFileTest, RestoreWithoutBackupThrows) {
  EXPECT_THROW(parameter_file.restore(pf), std::runtime_error);
  EXPECT_EQ(read(pf), original);
}

TEST_F(ParameterFileTest, KeepsWindowsLineEndings) {
  write(pf, "Spectrum_cycles 20\r\nIonization_cycles 20\r\n");
  parameter_file.set(pf, "Spectrum_cycles", "0", false);
  EXPECT_EQ(read(pf), "Spectrum_cycles 0\r\nIonization_cycles 20\r\n");
}

TEST_F(ParameterFileTest, GetMissingKeyThrows) {
  EXPECT_THROW(ParameterFile::get(pf, "No_such_key"), std::runtime_error);
}
