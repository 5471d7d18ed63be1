#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <toml++/toml.hpp>
#include <type_traits>
#include <vector>

/**
 * @brief Validation utilities for TOML configuration parsing.
 *
 * Provides a chainable API for type-safe TOML field validation. Create a
 * validator with field<T>() or vectorField<T>(), chain constraints, then
 * extract the value with valueOr(default).
 *
 * @code
 * // Optional threshold in [0, 1], defaulting to 0.8
 * double threshold = validators::field<double>(config, "convergence_threshold")
 *                      .greaterThanEqual(0.0)
 *                      .lessThanEqual(1.0)
 *                      .valueOr(0.8);
 *
 * // Optional list of flags passed through to the simulation
 * std::vector<std::string> flags = validators::vectorField<std::string>(config, "flags")
 *                                    .valueOr({});
 * @endcode
 *
 * Missing fields yield the default. A field of the wrong type or one that
 * violates a constraint throws ValidationError naming the field.
 */
namespace validators {

/**
 * @brief Helper to get readable type names for error messages
 */
template <typename T>
std::string getTypeName() {
  if constexpr (std::is_same_v<T, int> || std::is_same_v<T, int64_t> || std::is_same_v<T, size_t>) {
    return "integer";
  } else if constexpr (std::is_same_v<T, double> || std::is_same_v<T, float>) {
    return "number";
  } else if constexpr (std::is_same_v<T, std::string>) {
    return "string";
  } else if constexpr (std::is_same_v<T, bool>) {
    return "boolean";
  } else {
    return "unknown type";
  }
}

/**
 * @brief Exception thrown when configuration validation fails.
 */
class ValidationError : public std::runtime_error {
 public:
  ValidationError(const std::string& field, const std::string& message)
      : std::runtime_error("Validation error for field '" + field + "': " + message) {}
};

/**
 * @brief Chainable validator for scalar TOML fields.
 *
 * Constraints set with greaterThan(), greaterThanEqual(), lessThanEqual() or
 * positive() are checked when the value is extracted.
 *
 * @tparam T Type of field to validate (int, size_t, double, string, bool)
 */
template <typename T>
class Validator {
 private:
  const toml::table& config;
  std::string key;
  std::optional<T> greater_than;
  std::optional<T> greater_than_equal;
  std::optional<T> less_than_equal;

 public:
  Validator(const toml::table& config_, const std::string& key_) : config(config_), key(key_) {}

  Validator& greaterThan(T greater_than_) {
    greater_than = greater_than_;
    return *this;
  }

  Validator& greaterThanEqual(T greater_than_equal_) {
    greater_than_equal = greater_than_equal_;
    return *this;
  }

  Validator& lessThanEqual(T less_than_equal_) {
    less_than_equal = less_than_equal_;
    return *this;
  }

  Validator& positive() {
    greaterThan(T{0});
    return *this;
  }

 private:
  std::optional<T> extractValue() {
    if (!config.contains(key)) {
      return std::nullopt;
    }

    // Key exists but wrong type - always an error
    auto val = config[key].template value<T>();
    if (!val) {
      throw ValidationError(key, "wrong type (expected " + getTypeName<T>() + ")");
    }

    return val;
  }

  T validateValue(T result) {
    if (greater_than && result <= *greater_than) {
      std::ostringstream oss;
      oss << "must be > " << *greater_than << ", got " << result;
      throw ValidationError(key, oss.str());
    }

    if (greater_than_equal && result < *greater_than_equal) {
      std::ostringstream oss;
      oss << "must be >= " << *greater_than_equal << ", got " << result;
      throw ValidationError(key, oss.str());
    }

    if (less_than_equal && result > *less_than_equal) {
      std::ostringstream oss;
      oss << "must be <= " << *less_than_equal << ", got " << result;
      throw ValidationError(key, oss.str());
    }

    return result;
  }

 public:
  /**
   * @brief Extracts field value or returns default if missing.
   *
   * @param default_value_ Default value to use if field is missing
   * @return The field value or default
   * @throws ValidationError If field exists but validation fails
   */
  T valueOr(T default_value_) {
    auto val = extractValue();
    if (!val) return default_value_;

    return validateValue(*val);
  }
};

/**
 * @brief Chainable validator for array TOML fields.
 *
 * @tparam T Element type of the vector
 */
template <typename T>
class VectorValidator {
 private:
  const toml::table& config;
  std::string key;

 public:
  VectorValidator(const toml::table& config_, const std::string& key_) : config(config_), key(key_) {}

 private:
  std::optional<std::vector<T>> extractVector() {
    if (!config.contains(key)) {
      return std::nullopt;
    }

    auto* arr = config[key].as_array();
    if (!arr) {
      throw ValidationError(key, "wrong type (expected array)");
    }

    std::vector<T> result;
    for (size_t i = 0; i < arr->size(); ++i) {
      auto val = arr->at(i).template value<T>();
      if (!val) {
        std::ostringstream oss;
        oss << "element [" << i << "] wrong type (expected " << getTypeName<T>() << ")";
        throw ValidationError(key, oss.str());
      }
      result.push_back(*val);
    }

    return result;
  }

 public:
  /**
   * @brief Extracts the array or returns the default if it is missing.
   *
   * @throws ValidationError If the field is not an array of T
   */
  std::vector<T> valueOr(const std::vector<T>& default_value_) {
    auto val = extractVector();
    return val ? *val : default_value_;
  }
};

template <typename T>
Validator<T> field(const toml::table& config_, const std::string& key_) {
  return Validator<T>(config_, key_);
}

template <typename T>
VectorValidator<T> vectorField(const toml::table& config_, const std::string& key_) {
  return VectorValidator<T>(config_, key_);
}

/**
 * @brief Extracts an optional table from a TOML configuration.
 *
 * @param config Parent TOML table
 * @param key Name of the table field
 * @return Pointer to the table, or nullptr if the key is absent
 * @throws ValidationError if the key exists but is not a table
 */
inline const toml::table* getOptionalTable(const toml::table& config, const std::string& key) {
  if (!config.contains(key)) {
    return nullptr;
  }

  auto* table = config[key].as_table();
  if (!table) {
    throw ValidationError(key, "must be a table");
  }

  return table;
}

/**
 * @brief Rejects keys of a table that are not in the allowed set.
 *
 * @throws ValidationError naming the first unknown key
 */
inline void requireKnownKeys(const toml::table& table, const std::set<std::string>& allowed_keys,
                             const std::string& table_name) {
  for (const auto& [key, node] : table) {
    std::string key_str(key.str());
    if (allowed_keys.find(key_str) == allowed_keys.end()) {
      throw ValidationError(table_name, "unknown key '" + key_str + "'");
    }
  }
}

} // namespace validators
