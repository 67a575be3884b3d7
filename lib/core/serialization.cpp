#include "chartok/serialization.hpp"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <string>
#include <utility>
#include <vector>

#include "chartok/errors.hpp"

namespace chartok {

namespace {

constexpr int kIndent = 2;

bool read_token_id(const json& value, TokenId& out) {
  if (value.is_number_unsigned()) {
    const auto v = value.get<std::uint64_t>();
    if (v > std::numeric_limits<TokenId>::max()) return false;
    out = static_cast<TokenId>(v);
    return true;
  }
  if (value.is_number_integer()) {
    const auto v = value.get<std::int64_t>();
    if (v < 0 || v > std::numeric_limits<TokenId>::max()) return false;
    out = static_cast<TokenId>(v);
    return true;
  }
  return false;
}

json optional_id(const std::optional<TokenId>& id) {
  return id ? json(*id) : json(nullptr);
}

std::optional<TokenId> read_special(const json& doc, const char* key) {
  if (!doc.contains(key)) {
    throw CorruptStateError(std::string("Invalid tokenizer file: missing '") +
                            key + "'.");
  }
  const json& value = doc.at(key);
  if (value.is_null()) return std::nullopt;
  TokenId id = 0;
  if (!read_token_id(value, id)) {
    throw CorruptStateError(std::string("Invalid tokenizer file: '") + key +
                            "' must be null or a non-negative integer.");
  }
  return id;
}

}  // namespace

json to_json(const VocabState& state) {
  std::vector<std::pair<TokenId, const std::string*>> entries;
  entries.reserve(state.stoi.size());
  for (const auto& [token, id] : state.stoi) {
    entries.emplace_back(id, &token);
  }
  std::sort(entries.begin(), entries.end());

  json stoi = json::object();
  for (const auto& [id, token] : entries) {
    stoi[*token] = id;
  }

  json doc = json::object();
  doc["version"] = kFormatVersion;
  doc["stoi"] = std::move(stoi);
  doc["pad_id"] = optional_id(state.pad_id);
  doc["unk_id"] = optional_id(state.unk_id);
  return doc;
}

std::string dump_vocab(const VocabState& state) {
  return to_json(state).dump(kIndent) + "\n";
}

VocabState state_from_json(const json& doc) {
  if (!doc.is_object()) {
    throw CorruptStateError("Invalid tokenizer file: expected a JSON object.");
  }
  if (doc.contains("version")) {
    const json& version = doc.at("version");
    if (!version.is_string() ||
        version.get<std::string>() != kFormatVersion) {
      throw CorruptStateError("Unsupported tokenizer format version: " +
                              version.dump());
    }
  }
  if (!doc.contains("stoi") || !doc.at("stoi").is_object()) {
    throw CorruptStateError("Invalid tokenizer file: missing or bad 'stoi'.");
  }
  if (!doc.contains("pad_id") || !doc.contains("unk_id")) {
    throw CorruptStateError(
        "Invalid tokenizer file: missing 'pad_id'/'unk_id'.");
  }

  VocabState state;
  const json& stoi = doc.at("stoi");
  if (stoi.empty()) {
    throw CorruptStateError("Invalid tokenizer file: 'stoi' is empty.");
  }
  for (const auto& item : stoi.items()) {
    if (item.key().empty()) {
      throw CorruptStateError("Invalid tokenizer file: empty key in 'stoi'.");
    }
    TokenId id = 0;
    if (!read_token_id(item.value(), id)) {
      throw CorruptStateError("Invalid tokenizer file: id for '" +
                              item.key() +
                              "' must be a non-negative integer.");
    }
    state.stoi.emplace(item.key(), id);
  }
  state.pad_id = read_special(doc, "pad_id");
  state.unk_id = read_special(doc, "unk_id");
  return state;
}

VocabState parse_vocab(const std::string& content) {
  json doc;
  try {
    doc = json::parse(content);
  } catch (const json::parse_error& e) {
    throw CorruptStateError(std::string("Invalid tokenizer file: ") +
                            e.what());
  }
  return state_from_json(doc);
}

}  // namespace chartok
