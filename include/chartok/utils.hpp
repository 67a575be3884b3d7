#pragma once

#include <string>
#include <vector>

#include "chartok/types.hpp"

namespace chartok {

int getenv_int(const char* name, int fallback);
bool getenv_bool(const char* name, bool fallback);
std::string getenv_str(const char* name, const std::string& fallback);

// Parses decimal token ids; throws InvalidInputError on anything else.
std::vector<TokenId> parse_token_ids(const std::vector<std::string>& args);
std::string join_token_ids(const std::vector<TokenId>& ids);

}  // namespace chartok
