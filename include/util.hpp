#pragma once

#include <ctime>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "config_types.hpp"

/**
 * @brief Parses the command line into a ParsedArgs struct.
 *
 * Prints the usage and exits with status 0 for --help, and with status 1 for
 * unknown options or missing option values.
 *
 * @param argc Argument count (same as main)
 * @param argv Argument vector (same as main)
 * @return Parsed arguments
 */
ParsedArgs parseArguments(int argc, char** argv);

/**
 * @brief Returns the usage message printed for --help.
 */
std::string usage(const std::string& program);

bool hasSuffix(const std::string& str, const std::string& suffix);

std::string toLower(std::string str);

/**
 * @brief Removes leading and trailing whitespace.
 */
std::string trim(const std::string& str);

/**
 * @brief Splits a string on runs of whitespace, dropping empty tokens.
 */
std::vector<std::string> splitWhitespace(const std::string& str);

/**
 * @brief Renders a duration in seconds as H:MM:SS.
 *
 * Fractional seconds are truncated and negative durations are clamped to zero.
 * Hours are not wrapped at 24.
 */
std::string formatElapsed(double seconds);

/**
 * @brief Formats a point in local time, e.g. "%Y-%m-%d %H:%M:%S".
 */
std::string formatLocalTime(std::time_t time, const char* format);

/**
 * @brief Compares strings in natural order, digit runs compare numerically.
 *
 * "model2.pf" sorts before "model10.pf".
 */
bool naturalLess(const std::string& a, const std::string& b);

/**
 * @brief Quotes a string for use as a single POSIX shell word.
 */
std::string shellQuote(const std::string& str);

/**
 * @brief Looks up a lower-cased string in an enum map.
 *
 * @return The enum value, or nullopt if the string is not a key of the map
 */
template <typename T>
std::optional<T> parseEnum(const std::string& str, const std::map<std::string, T>& enum_map) {
  auto it = enum_map.find(toLower(str));
  if (it == enum_map.end()) {
    return std::nullopt;
  }
  return it->second;
}

/**
 * @brief Looks up an optional string in an enum map, falling back to a default.
 *
 * Returns the default when the string is missing or not a key of the map.
 */
template <typename T>
T parseEnum(const std::optional<std::string>& str, const std::map<std::string, T>& enum_map, T default_value) {
  if (!str.has_value()) {
    return default_value;
  }
  return parseEnum(*str, enum_map).value_or(default_value);
}

/**
 * @brief Reverse lookup of an enum value in a string map.
 */
template <typename T>
std::string enumToString(T value, const std::map<std::string, T>& enum_map) {
  for (const auto& [name, val] : enum_map) {
    if (val == value) return name;
  }
  return "unknown";
}
