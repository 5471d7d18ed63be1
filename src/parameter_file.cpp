#include "parameter_file.hpp"

#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace {

std::string readFile(const fs::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw std::runtime_error("Could not open parameter file " + path.string());
  }
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

// Write to a temporary file next to the target, then rename it over the target
void writeFileAtomic(const fs::path& path, const std::string& content) {
  fs::path tmp = path;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out) {
      throw std::runtime_error("Could not open temporary file " + tmp.string());
    }
    out << content;
    out.flush();
    if (!out) {
      throw std::runtime_error("Failed while writing temporary file " + tmp.string());
    }
  }

  std::error_code ec;
  fs::rename(tmp, path, ec);
  if (ec) {
    fs::remove(tmp, ec);
    throw std::runtime_error("Could not replace parameter file " + path.string());
  }
}

/**
 * Locates the key and value tokens of a parameter line. Returns false for
 * blank lines, comments and lines whose key does not match.
 */
bool matchEntry(const std::string& line, const std::string& key, size_t& value_begin, size_t& value_end) {
  const char* blanks = " \t\r";
  size_t key_begin = line.find_first_not_of(blanks);
  if (key_begin == std::string::npos || line[key_begin] == '#') return false;

  size_t key_end = line.find_first_of(blanks, key_begin);
  if (key_end == std::string::npos) key_end = line.size();

  std::string token = line.substr(key_begin, key_end - key_begin);
  if (token != key && token.rfind(key + "(", 0) != 0) return false;

  value_begin = line.find_first_not_of(blanks, key_end);
  if (value_begin == std::string::npos) {
    // Key without a value: append one after a single space
    value_begin = key_end;
    value_end = key_end;
    return true;
  }
  value_end = line.find_first_of(blanks, value_begin);
  if (value_end == std::string::npos) value_end = line.size();
  return true;
}

} // namespace

fs::path ParameterFile::backupPath(const fs::path& path) {
  fs::path backup = path;
  backup += BACKUP_SUFFIX;
  return backup;
}

bool ParameterFile::hasBackup(const fs::path& path) const {
  std::error_code ec;
  return fs::exists(backupPath(path), ec);
}

void ParameterFile::set(const fs::path& path, const std::string& key, const std::string& value, bool make_backup) {
  std::string content = readFile(path);

  std::string updated;
  updated.reserve(content.size() + value.size());
  size_t matches = 0;
  size_t pos = 0;
  while (pos < content.size()) {
    size_t eol = content.find('\n', pos);
    size_t next = (eol == std::string::npos) ? content.size() : eol + 1;
    std::string line = content.substr(pos, (eol == std::string::npos ? content.size() : eol) - pos);

    size_t value_begin = 0;
    size_t value_end = 0;
    if (matchEntry(line, key, value_begin, value_end)) {
      std::string separator = (value_begin == value_end) ? " " : "";
      line = line.substr(0, value_begin) + separator + value + line.substr(value_end);
      matches++;
    }

    updated += line;
    if (eol != std::string::npos) updated += '\n';
    pos = next;
  }

  if (matches == 0) {
    throw std::runtime_error("Parameter '" + key + "' not found in " + path.string());
  }

  if (make_backup) {
    std::error_code ec;
    fs::copy_file(path, backupPath(path), fs::copy_options::overwrite_existing, ec);
    if (ec) {
      throw std::runtime_error("Could not back up " + path.string() + ": " + ec.message());
    }
  }

  writeFileAtomic(path, updated);
}

void ParameterFile::restore(const fs::path& path) {
  fs::path backup = backupPath(path);
  if (!hasBackup(path)) {
    throw std::runtime_error("No backup to restore for " + path.string());
  }

  std::error_code ec;
  fs::copy_file(backup, path, fs::copy_options::overwrite_existing, ec);
  if (ec) {
    throw std::runtime_error("Could not restore " + path.string() + " from " + backup.string() + ": " + ec.message());
  }
  fs::remove(backup, ec);
}

std::string ParameterFile::get(const fs::path& path, const std::string& key) {
  std::istringstream content(readFile(path));
  std::string line;
  while (std::getline(content, line)) {
    size_t value_begin = 0;
    size_t value_end = 0;
    if (matchEntry(line, key, value_begin, value_end)) {
      return line.substr(value_begin, value_end - value_begin);
    }
  }
  throw std::runtime_error("Parameter '" + key + "' not found in " + path.string());
}
