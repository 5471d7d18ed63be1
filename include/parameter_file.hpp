#pragma once

#include <filesystem>
#include <string>

/**
 * @brief Edits key/value configuration files of a model on disk.
 *
 * The orchestrator only changes a model's configuration through this
 * interface, so the backup/restore sequence around a split-cycle run can be
 * checked in isolation.
 */
class ConfigMutator {
 public:
  virtual ~ConfigMutator() = default;

  /**
   * @brief Rewrites the value of a key in place.
   *
   * @param path Configuration file to edit
   * @param key Key whose value is replaced
   * @param value New value
   * @param make_backup If true, copy the file to its backup path before editing
   */
  virtual void set(const std::filesystem::path& path, const std::string& key, const std::string& value,
                   bool make_backup) = 0;

  /**
   * @brief Copies the backup back over the original file and removes the backup.
   */
  virtual void restore(const std::filesystem::path& path) = 0;

  virtual bool hasBackup(const std::filesystem::path& path) const = 0;
};

/**
 * @brief ConfigMutator for the simulation's ".pf" parameter files.
 *
 * A parameter file holds one "key(units) value" entry per line; lines starting
 * with '#' are comments. Only the value token is replaced, so alignment,
 * trailing text and line endings of the file are kept. Edits are written to a
 * temporary file which is then renamed over the original.
 */
class ParameterFile : public ConfigMutator {
 public:
  static constexpr const char* BACKUP_SUFFIX = ".bak";

  void set(const std::filesystem::path& path, const std::string& key, const std::string& value,
           bool make_backup) override;
  void restore(const std::filesystem::path& path) override;
  bool hasBackup(const std::filesystem::path& path) const override;

  /**
   * @brief Reads the value of a key, the first whitespace-delimited token after it.
   *
   * @throws std::runtime_error if the file cannot be read or the key is absent
   */
  static std::string get(const std::filesystem::path& path, const std::string& key);

  static std::filesystem::path backupPath(const std::filesystem::path& path);
};
