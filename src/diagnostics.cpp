#include "diagnostics.hpp"

#include <cstdlib>
#include <fstream>
#include <iterator>
#include <sstream>
#include <system_error>

#include "util.hpp"

namespace fs = std::filesystem;

namespace {

// Number of tokens in a convergence summary line of the diagnostic file
const size_t CONVERGENCE_LINE_TOKENS = 11;
const double MYSTERY_FRACTION = -1.0;

const std::string ERROR_SUMMARY_HEADER = "Recurrences --  Description";

std::string readFile(const fs::path& path) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("Could not open diagnostic file " + path.string());
  }
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

// Parses "(0.830)" or "0.830", returning the mystery value if it is not a number
double parseFraction(std::string token) {
  if (!token.empty() && token.front() == '(') token.erase(0, 1);
  if (!token.empty() && token.back() == ')') token.pop_back();
  if (token.empty()) return MYSTERY_FRACTION;

  char* end = nullptr;
  double value = std::strtod(token.c_str(), &end);
  if (end == token.c_str() || *end != '\0') return MYSTERY_FRACTION;
  return value;
}

} // namespace

fs::path DiagnosticConvergenceEvaluator::diagnosticFile(const Model& model) {
  return model.diagDirectory() / (model.root + "_0.diag");
}

ConvergenceReport DiagnosticConvergenceEvaluator::parse(const std::string& content) {
  ConvergenceReport report;
  std::istringstream in(content);
  std::string line;
  while (std::getline(in, line)) {
    if (line.find("converged") == std::string::npos || line.find("converging") == std::string::npos) continue;

    std::vector<std::string> tokens = splitWhitespace(line);
    if (tokens.size() != CONVERGENCE_LINE_TOKENS) continue;

    report.converged.push_back(parseFraction(tokens[2]));
    report.converging.push_back(parseFraction(tokens[6]));
  }
  return report;
}

ConvergenceReport DiagnosticConvergenceEvaluator::evaluate(const Model& model) const {
  fs::path path = diagnosticFile(model);
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    throw DiagnosticNotFound(path);
  }
  return parse(readFile(path));
}

ConvergenceState classifyConvergence(const ConvergenceReport& report, double threshold) {
  if (report.empty()) {
    return ConvergenceState::AMBIGUOUS;
  }

  double last = report.last();
  if (!(last >= 0.0 && last <= 1.0)) {
    return ConvergenceState::AMBIGUOUS;
  }
  return last >= threshold ? ConvergenceState::CONVERGED : ConvergenceState::NOT_CONVERGED;
}

ErrorTally parseErrorSummary(const std::string& content) {
  ErrorTally tally;
  std::istringstream in(content);
  std::string line;
  bool in_summary = false;
  while (std::getline(in, line)) {
    if (!in_summary) {
      in_summary = line.find(ERROR_SUMMARY_HEADER) != std::string::npos;
      continue;
    }

    size_t separator = line.find(" -- ");
    if (separator == std::string::npos) {
      in_summary = false;
      continue;
    }

    std::string count_str = trim(line.substr(0, separator));
    char* end = nullptr;
    long count = std::strtol(count_str.c_str(), &end, 10);
    if (count_str.empty() || *end != '\0') {
      in_summary = false;
      continue;
    }
    tally[trim(line.substr(separator + 4))] += count;
  }
  return tally;
}

ErrorTally tallyErrors(const Model& model) {
  ErrorTally tally;
  fs::path diag_dir = model.diagDirectory();

  std::error_code ec;
  if (!fs::is_directory(diag_dir, ec)) {
    return tally;
  }

  std::string prefix = model.root + "_";
  for (const auto& entry : fs::directory_iterator(diag_dir, ec)) {
    std::string filename = entry.path().filename().string();
    if (filename.rfind(prefix, 0) != 0 || !hasSuffix(filename, ".diag")) continue;

    for (const auto& [message, count] : parseErrorSummary(readFile(entry.path()))) {
      tally[message] += count;
    }
  }
  return tally;
}
