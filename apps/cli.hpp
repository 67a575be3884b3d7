#pragma once

#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "chartok/config.hpp"
#include "chartok/types.hpp"

namespace chartok::cli {

using Args = std::vector<std::string>;

// Malformed command line; reported with the command's usage and exit code 1.
class UsageError : public std::runtime_error {
 public:
  explicit UsageError(const std::string& message)
      : std::runtime_error(message) {}
};

struct FitRequest {
  std::string output;
  std::optional<std::string> text;
  Args files;
  FitConfig config;
};

struct EncodeRequest {
  std::string vocab;
  std::string text;
  bool strict = false;
};

struct DecodeRequest {
  std::string vocab;
  std::vector<TokenId> ids;
  bool skip_specials = true;
};

// Non-negative decimal that fits an int.
int parse_min_freq(const std::string& value);

// Flags override @p defaults, which normally come from the environment.
FitRequest parse_fit_args(const Args& args, const FitConfig& defaults);
EncodeRequest parse_encode_args(const Args& args);
DecodeRequest parse_decode_args(const Args& args);

/**
 * @brief Runs `chartok <command> ...`.
 *
 * @param args Everything after the program name.
 * @return 0 on success, 1 on a usage error, 2 when the tokenizer fails.
 */
int run(const Args& args, std::ostream& out, std::ostream& err);

}  // namespace chartok::cli
