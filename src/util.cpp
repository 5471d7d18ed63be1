#include "util.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <sstream>

#include "defs.hpp"

namespace {

[[noreturn]] void exitWithUsage(const std::string& program, const std::string& message) {
  std::cerr << "ERROR: " << message << "\n\n" << usage(program);
  exit(1);
}

// Returns the value following option argv[i], advancing i.
std::string optionValue(int argc, char** argv, int& i) {
  if (i + 1 >= argc) {
    exitWithUsage(argv[0], std::string("missing value for option ") + argv[i]);
  }
  return argv[++i];
}

Verbosity parseVerbosity(const std::string& program, const std::string& value) {
  if (value.size() == 1 && std::isdigit(static_cast<unsigned char>(value[0]))) {
    int level = value[0] - '0';
    if (level <= static_cast<int>(Verbosity::ALL)) {
      return static_cast<Verbosity>(level);
    }
  }
  auto verbosity = parseEnum(value, VERBOSITY_MAP);
  if (!verbosity.has_value()) {
    exitWithUsage(program, "unknown verbosity level '" + value + "'");
  }
  return *verbosity;
}

} // namespace

std::string usage(const std::string& program) {
  std::ostringstream ss;
  ss << "Usage: " << program << " [options] [config.toml]\n"
     << "\n"
     << "Run every simulation model found below the search directory.\n"
     << "\n"
     << "Options:\n"
     << "  -s, --split-cycles      run ionization and spectrum cycles separately\n"
     << "  -r, --resume            resume every model from its saved state\n"
     << "      --no-auto-restart   do not resume models that have a saved state\n"
     << "  -n, --n-cores N         launch with N processes\n"
     << "  -v, --verbosity LEVEL   silent, progress, extra, transport, all (or 0-4)\n"
     << "  -t, --threshold X       convergence threshold in [0, 1]\n"
     << "  -f, --flags \"FLAGS\"     flags passed through to the simulation\n"
     << "  -d, --dir PATH          directory searched for parameter files\n"
     << "  -q, --quiet             suppress all non-error output\n"
     << "  -h, --help              print this message\n";
  return ss.str();
}

ParsedArgs parseArguments(int argc, char** argv) {
  ParsedArgs args;
  std::string program = argc > 0 ? argv[0] : "simrun";

  for (int i = 1; i < argc; i++) {
    std::string arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      std::cout << usage(program);
      exit(0);
    } else if (arg == "-s" || arg == "--split-cycles") {
      args.overrides.split_cycles = true;
    } else if (arg == "-r" || arg == "--resume") {
      args.overrides.resume = true;
    } else if (arg == "--no-auto-restart") {
      args.overrides.auto_restart = false;
    } else if (arg == "-q" || arg == "--quiet") {
      args.quietmode = true;
    } else if (arg == "-n" || arg == "--n-cores") {
      std::string value = optionValue(argc, argv, i);
      char* end = nullptr;
      long cores = std::strtol(value.c_str(), &end, 10);
      if (end == value.c_str() || *end != '\0' || cores < 1) {
        exitWithUsage(program, "number of cores must be a positive integer, got '" + value + "'");
      }
      args.overrides.n_cores = static_cast<size_t>(cores);
    } else if (arg == "-v" || arg == "--verbosity") {
      args.overrides.verbosity = parseVerbosity(program, optionValue(argc, argv, i));
    } else if (arg == "-t" || arg == "--threshold") {
      std::string value = optionValue(argc, argv, i);
      char* end = nullptr;
      double threshold = std::strtod(value.c_str(), &end);
      if (end == value.c_str() || *end != '\0' || !std::isfinite(threshold)) {
        exitWithUsage(program, "threshold must be a finite number, got '" + value + "'");
      }
      args.overrides.convergence_threshold = threshold;
    } else if (arg == "-f" || arg == "--flags") {
      args.overrides.flags = splitWhitespace(optionValue(argc, argv, i));
    } else if (arg == "-d" || arg == "--dir") {
      args.overrides.search_dir = optionValue(argc, argv, i);
    } else if (!arg.empty() && arg[0] == '-') {
      exitWithUsage(program, "unknown option '" + arg + "'");
    } else if (!args.config_filename.has_value()) {
      args.config_filename = arg;
    } else {
      exitWithUsage(program, "more than one configuration file given");
    }
  }

  return args;
}

bool hasSuffix(const std::string& str, const std::string& suffix) {
  return str.size() >= suffix.size() && str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string toLower(std::string str) {
  std::transform(str.begin(), str.end(), str.begin(), [](unsigned char c) { return std::tolower(c); });
  return str;
}

std::string trim(const std::string& str) {
  auto is_space = [](unsigned char c) { return std::isspace(c); };
  auto begin = std::find_if_not(str.begin(), str.end(), is_space);
  auto end = std::find_if_not(str.rbegin(), str.rend(), is_space).base();
  if (begin >= end) return "";
  return std::string(begin, end);
}

std::vector<std::string> splitWhitespace(const std::string& str) {
  std::vector<std::string> tokens;
  std::istringstream ss(str);
  std::string token;
  while (ss >> token) {
    tokens.push_back(token);
  }
  return tokens;
}

std::string formatElapsed(double seconds) {
  if (!(seconds > 0.0)) seconds = 0.0;
  long long total = static_cast<long long>(std::floor(seconds));
  long long hours = total / 3600;
  long long minutes = (total % 3600) / 60;
  long long secs = total % 60;

  std::ostringstream ss;
  ss << hours << ":" << std::setw(2) << std::setfill('0') << minutes << ":" << std::setw(2) << std::setfill('0')
     << secs;
  return ss.str();
}

std::string formatLocalTime(std::time_t time, const char* format) {
  std::tm tm = *std::localtime(&time);
  std::ostringstream ss;
  ss << std::put_time(&tm, format);
  return ss.str();
}

bool naturalLess(const std::string& a, const std::string& b) {
  size_t i = 0;
  size_t j = 0;
  while (i < a.size() && j < b.size()) {
    bool digit_a = std::isdigit(static_cast<unsigned char>(a[i]));
    bool digit_b = std::isdigit(static_cast<unsigned char>(b[j]));
    if (digit_a && digit_b) {
      size_t end_a = i;
      size_t end_b = j;
      while (end_a < a.size() && std::isdigit(static_cast<unsigned char>(a[end_a]))) end_a++;
      while (end_b < b.size() && std::isdigit(static_cast<unsigned char>(b[end_b]))) end_b++;

      // Compare digit runs by value without converting: strip leading zeros, then length, then digits
      std::string run_a = a.substr(i, end_a - i);
      std::string run_b = b.substr(j, end_b - j);
      run_a.erase(0, std::min(run_a.find_first_not_of('0'), run_a.size() - 1));
      run_b.erase(0, std::min(run_b.find_first_not_of('0'), run_b.size() - 1));
      if (run_a.size() != run_b.size()) return run_a.size() < run_b.size();
      if (run_a != run_b) return run_a < run_b;

      i = end_a;
      j = end_b;
    } else {
      if (a[i] != b[j]) return a[i] < b[j];
      i++;
      j++;
    }
  }
  return (a.size() - i) < (b.size() - j);
}

std::string shellQuote(const std::string& str) {
  std::string quoted = "'";
  for (char c : str) {
    if (c == '\'') {
      quoted += "'\\''";
    } else {
      quoted += c;
    }
  }
  quoted += "'";
  return quoted;
}
