#include "env_config.hpp"
#include <redlog.hpp>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <cstring>
#include <system_error>
#include <utility>

namespace sk1p::utils {

namespace {

template <typename T> std::optional<T> parse_integer(const std::string& text) {
  T value{};
  const char* begin = text.data();
  const char* end = begin + text.size();
  auto [ptr, ec] = std::from_chars(begin, end, value);
  if (ec != std::errc() || ptr != end) {
    return std::nullopt;
  }
  return value;
}

} // namespace

env_config::env_config(std::string prefix) : prefix_(std::move(prefix)) {
  if (!prefix_.empty() && prefix_.back() != '_') {
    prefix_.push_back('_');
  }
}

std::optional<std::string> env_config::lookup(const std::string& name) const {
  const char* raw = std::getenv(env_name(name).c_str());
  if (!raw) {
    return std::nullopt;
  }

  std::string value(raw);
  auto is_blank = [](unsigned char c) { return std::isspace(c) != 0; };
  size_t first = 0;
  while (first < value.size() && is_blank(static_cast<unsigned char>(value[first]))) {
    ++first;
  }
  size_t last = value.size();
  while (last > first && is_blank(static_cast<unsigned char>(value[last - 1]))) {
    --last;
  }
  if (first == last) {
    return std::nullopt;
  }
  return value.substr(first, last - first);
}

void env_config::warn_unparsed(const std::string& name, const std::string& value, const char* expected) const {
  auto log = redlog::get_logger("sk1p.config");
  log.wrn(
      "ignoring environment value", redlog::field("variable", env_name(name)), redlog::field("value", value),
      redlog::field("expected", expected)
  );
}

bool env_config::equals_ignore_case(const std::string& value, const char* label) {
  if (value.size() != std::strlen(label)) {
    return false;
  }
  for (size_t i = 0; i < value.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(value[i])) != std::tolower(static_cast<unsigned char>(label[i]))) {
      return false;
    }
  }
  return true;
}

template <> std::string env_config::get<std::string>(const std::string& name, std::string default_value) const {
  auto value = lookup(name);
  return value ? *value : default_value;
}

template <> bool env_config::get<bool>(const std::string& name, bool default_value) const {
  auto value = lookup(name);
  if (!value) {
    return default_value;
  }
  for (const char* label : {"1", "true", "yes", "on"}) {
    if (equals_ignore_case(*value, label)) {
      return true;
    }
  }
  for (const char* label : {"0", "false", "no", "off"}) {
    if (equals_ignore_case(*value, label)) {
      return false;
    }
  }
  warn_unparsed(name, *value, "a boolean");
  return default_value;
}

template <> int env_config::get<int>(const std::string& name, int default_value) const {
  auto value = lookup(name);
  if (!value) {
    return default_value;
  }
  auto parsed = parse_integer<int>(*value);
  if (!parsed) {
    warn_unparsed(name, *value, "an integer");
    return default_value;
  }
  return *parsed;
}

template <> size_t env_config::get<size_t>(const std::string& name, size_t default_value) const {
  auto value = lookup(name);
  if (!value) {
    return default_value;
  }
  auto parsed = parse_integer<size_t>(*value);
  if (!parsed) {
    warn_unparsed(name, *value, "a non-negative integer");
    return default_value;
  }
  return *parsed;
}

} // namespace sk1p::utils
