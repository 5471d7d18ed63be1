#include "output_classifier.hpp"

#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <utility>

#include "util.hpp"

const std::string SimulationOutputClassifier::CONVERGENCE_STATISTICS_MARKER =
    "Convergence statistics for the wind after the ionization calculation";

namespace {

const std::string INDENT = "         ";

// Returns the token at a position counted from the front, or an empty string
std::string tokenAt(const std::vector<std::string>& tokens, size_t index) {
  return index < tokens.size() ? tokens[index] : "";
}

// Returns the token at a position counted from the back (1 is the last token)
std::string tokenFromEnd(const std::vector<std::string>& tokens, size_t offset) {
  return offset <= tokens.size() ? tokens[tokens.size() - offset] : "";
}

bool parseNumber(const std::string& field, double& number) {
  if (field.empty()) return false;
  char* end = nullptr;
  number = std::strtod(field.c_str(), &end);
  return end != field.c_str() && *end == '\0';
}

// H:MM:SS when the field is a number of seconds, the raw field otherwise
std::string elapsedField(const std::string& field) {
  double seconds = 0.0;
  if (!parseNumber(field, seconds)) return field;
  return formatElapsed(seconds);
}

std::string percentField(const std::string& field) {
  double percent = 0.0;
  if (!parseNumber(field, percent)) return field;
  std::ostringstream ss;
  ss << std::fixed << std::setprecision(0) << percent;
  return ss.str();
}

std::string photonCountField(const std::string& field, size_t n_cores) {
  double count = 0.0;
  if (!parseNumber(field, count)) return field;
  std::ostringstream ss;
  ss << std::scientific << std::setprecision(2) << count * static_cast<double>(n_cores);
  return ss.str();
}

bool contains(const std::string& line, const char* text) { return line.find(text) != std::string::npos; }

} // namespace

Classification classifyLine(const std::string& line, size_t n_cores, Verbosity verbosity, std::time_t now) {
  Classification result;
  result.keep_going = !contains(line, SimulationOutputClassifier::CONVERGENCE_STATISTICS_MARKER.c_str());

  if (verbosity >= Verbosity::ALL) {
    result.emit.push_back(line);
    return result;
  }
  if (verbosity == Verbosity::SILENT) {
    return result;
  }

  std::vector<std::string> tokens = splitWhitespace(line);

  if (contains(line, "Beginning cycle")) {
    // !!Python: Beginning cycle <i> of <n> for defining wind
    std::string kind = contains(line, "defining wind") ? "Ionization" : "Spectrum";
    result.emit.push_back("[" + formatLocalTime(now, "%H:%M") + "] Starting " + kind + " Cycle " + tokenAt(tokens, 3) +
                          "/" + tokenAt(tokens, 5));
  } else if (contains(line, "photon transport completed in")) {
    // !!Python: photon transport completed in <t> seconds
    if (verbosity >= Verbosity::EXTRA) {
      result.emit.push_back(INDENT + "Photons transported in " + elapsedField(tokenAt(tokens, 5)) + " hrs:mins:secs");
    }
  } else if (contains(line, "Completed ionization cycle") || contains(line, "Completed spectrum cycle")) {
    // Completed ionization cycle <i> :  The elapsed TIME was <t>
    result.emit.push_back(INDENT + "Elapsed run time " + elapsedField(tokenFromEnd(tokens, 1)) + " hrs:mins:secs");
  } else if (contains(line, "Completed entire program")) {
    result.emit.push_back("Simulation completed in " + elapsedField(tokenFromEnd(tokens, 1)) + " hrs:mins:secs");
  } else if (contains(line, " per cent of ") && contains(line, "photons transported")) {
    // <p> per cent of <n> photons transported; every process reports its own share
    if (verbosity >= Verbosity::EXTRA_TRANSPORT) {
      result.emit.push_back(INDENT + percentField(tokenFromEnd(tokens, 7)) + "% of " +
                            photonCountField(tokenFromEnd(tokens, 3), n_cores) + " photons transported");
    }
  } else if (contains(line, "cells") && contains(line, "converged")) {
    if (verbosity >= Verbosity::EXTRA) {
      result.emit.push_back(INDENT + trim(line));
    }
  }

  return result;
}

SimulationOutputClassifier::SimulationOutputClassifier(size_t n_cores_, Verbosity verbosity_,
                                                       std::function<std::time_t()> clock_)
    : n_cores(n_cores_), verbosity(verbosity_), clock(std::move(clock_)) {}

Classification SimulationOutputClassifier::classify(const std::string& line) const {
  return classifyLine(line, n_cores, verbosity, clock());
}
