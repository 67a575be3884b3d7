#include "chartok/utils.hpp"

#include <cerrno>
#include <cstdlib>
#include <limits>
#include <string>
#include <vector>

#include "chartok/errors.hpp"

namespace chartok {

int getenv_int(const char* name, int fallback) {
  if (!name) return fallback;
  if (const char* value = std::getenv(name)) {
    char* end = nullptr;
    errno = 0;
    long parsed = std::strtol(value, &end, 10);
    if (end == value || *end != '\0' || errno == ERANGE) return fallback;
    if (parsed < std::numeric_limits<int>::min() ||
        parsed > std::numeric_limits<int>::max()) {
      return fallback;
    }
    return static_cast<int>(parsed);
  }
  return fallback;
}

bool getenv_bool(const char* name, bool fallback) {
  const std::string value = getenv_str(name, "");
  if (value == "1" || value == "true" || value == "yes" || value == "on") {
    return true;
  }
  if (value == "0" || value == "false" || value == "no" || value == "off") {
    return false;
  }
  return fallback;
}

std::string getenv_str(const char* name, const std::string& fallback) {
  if (!name) return fallback;
  if (const char* value = std::getenv(name)) {
    if (value[0] != '\0') return std::string(value);
  }
  return fallback;
}

std::vector<TokenId> parse_token_ids(const std::vector<std::string>& args) {
  std::vector<TokenId> ids;
  ids.reserve(args.size());
  for (size_t i = 0; i < args.size(); ++i) {
    const std::string& arg = args[i];
    if (arg.empty() ||
        arg.find_first_not_of("0123456789") != std::string::npos) {
      throw InvalidInputError("Expected a non-negative token id at index " +
                              std::to_string(i) + ", got: '" + arg + "'");
    }
    errno = 0;
    unsigned long long parsed = std::strtoull(arg.c_str(), nullptr, 10);
    if (errno == ERANGE || parsed > std::numeric_limits<TokenId>::max()) {
      throw InvalidInputError("Token id out of range at index " +
                              std::to_string(i) + ": " + arg);
    }
    ids.push_back(static_cast<TokenId>(parsed));
  }
  return ids;
}

std::string join_token_ids(const std::vector<TokenId>& ids) {
  std::string out;
  for (size_t i = 0; i < ids.size(); ++i) {
    if (i > 0) out.push_back(' ');
    out += std::to_string(ids[i]);
  }
  return out;
}

}  // namespace chartok
