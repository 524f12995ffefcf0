#pragma once

#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string>
#include <utility>

namespace sk1p::utils {

/**
 * typed access to prefixed environment variables.
 *
 * env_config("SK1P").get<size_t>("CHUNK_SIZE", 0) reads SK1P_CHUNK_SIZE. unset or blank
 * variables yield the default; values that fail to parse log a warning and yield the default.
 */
class env_config {
public:
  explicit env_config(std::string prefix = "");

  template <typename T> T get(const std::string& name, T default_value) const;

  template <typename enum_type>
  enum_type get_enum(
      std::initializer_list<std::pair<const char*, enum_type>> mapping, const std::string& name,
      enum_type default_value
  ) const {
    auto value = lookup(name);
    if (!value) {
      return default_value;
    }
    for (const auto& [label, mapped] : mapping) {
      if (equals_ignore_case(*value, label)) {
        return mapped;
      }
    }
    warn_unparsed(name, *value, "one of the known names");
    return default_value;
  }

  std::string env_name(const std::string& name) const { return prefix_ + name; }

private:
  // trimmed value, or nullopt when unset or blank
  std::optional<std::string> lookup(const std::string& name) const;
  void warn_unparsed(const std::string& name, const std::string& value, const char* expected) const;
  static bool equals_ignore_case(const std::string& value, const char* label);

  std::string prefix_;
};

template <> std::string env_config::get<std::string>(const std::string& name, std::string default_value) const;
template <> bool env_config::get<bool>(const std::string& name, bool default_value) const;
template <> int env_config::get<int>(const std::string& name, int default_value) const;
template <> size_t env_config::get<size_t>(const std::string& name, size_t default_value) const;

} // namespace sk1p::utils
