#include "model.hpp"

#include <algorithm>
#include <system_error>

#include "util.hpp"

namespace fs = std::filesystem;

Model Model::fromParameterFile(const fs::path& pf_path) {
  Model model;
  model.root = pf_path.stem().string();
  model.directory = pf_path.has_parent_path() ? pf_path.parent_path() : fs::path(".");
  return model;
}

std::vector<Model> discoverModels(const fs::path& search_dir) {
  std::vector<std::string> files;

  std::error_code ec;
  if (!fs::is_directory(search_dir, ec)) {
    return {};
  }

  for (auto it = fs::recursive_directory_iterator(search_dir, fs::directory_options::skip_permission_denied, ec);
       it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (ec) break;
    if (!it->is_regular_file(ec) || it->path().extension() != ".pf") continue;

    std::string path = it->path().string();
    if (path.find("out.pf") != std::string::npos || path.find("py_wind") != std::string::npos) continue;
    files.push_back(path);
  }

  std::sort(files.begin(), files.end(), naturalLess);

  std::vector<Model> models;
  models.reserve(files.size());
  for (const auto& file : files) {
    models.push_back(Model::fromParameterFile(file));
  }
  return models;
}
