#pragma once

#include <filesystem>
#include <string>
#include <vector>

/**
 * @brief One simulation model: a root name and the directory containing it.
 *
 * A model is never changed by a run; only its parameter file on disk is.
 */
struct Model {
  std::string root; ///< Root name, the parameter file name without ".pf"
  std::filesystem::path directory; ///< Working directory of the model

  /**
   * @brief Builds a model from the path of its parameter file.
   */
  static Model fromParameterFile(const std::filesystem::path& pf_path);

  std::filesystem::path parameterFile() const { return directory / (root + ".pf"); }
  std::filesystem::path runLog() const { return directory / (root + ".log.txt"); }
  std::filesystem::path diagDirectory() const { return directory / ("diag_" + root); }

  /**
   * @brief Returns "<directory>/<root>" for messages.
   */
  std::string name() const { return (directory / root).string(); }
};

/**
 * @brief Finds all models below a directory.
 *
 * Searches recursively for "*.pf" files, skipping the "out.pf" files and the
 * "py_wind" parameter files written by the simulation tools. Models are
 * returned in natural order of their paths.
 *
 * @param search_dir Directory to search
 * @return Discovered models, empty if the directory does not exist
 */
std::vector<Model> discoverModels(const std::filesystem::path& search_dir);
