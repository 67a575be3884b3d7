#pragma once

#include <optional>
#include <string>
#include <unordered_map>

#include <nlohmann/json.hpp>

#include "chartok/types.hpp"

namespace chartok {

using json = nlohmann::ordered_json;

using CharToId = std::unordered_map<std::string, TokenId>;
using IdToChar = std::unordered_map<TokenId, std::string>;

// Everything the persisted format carries. The inverse mapping is derived.
struct VocabState {
  CharToId stoi;
  std::optional<TokenId> pad_id;
  std::optional<TokenId> unk_id;
};

// {"version", "stoi" (in id order), "pad_id", "unk_id"}.
json to_json(const VocabState& state);
std::string dump_vocab(const VocabState& state);

// Structural validation only; throws CorruptStateError.
VocabState state_from_json(const json& doc);
VocabState parse_vocab(const std::string& content);

}  // namespace chartok
