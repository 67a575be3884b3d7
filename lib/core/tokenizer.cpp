#include "chartok/tokenizer.hpp"

#include <algorithm>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "chartok/errors.hpp"
#include "chartok/file_system.hpp"
#include "chartok/utf8.hpp"

namespace chartok {

namespace {

struct CharCount {
  char32_t code_point;
  size_t count;
};

std::vector<CharCount> count_characters(const std::string& corpus,
                                        int min_freq) {
  std::map<char32_t, size_t> counts;
  for (char32_t cp : decode_utf8(corpus)) {
    ++counts[cp];
  }

  std::vector<CharCount> kept;
  kept.reserve(counts.size());
  for (const auto& [cp, count] : counts) {
    if (static_cast<long long>(count) >= min_freq) kept.push_back({cp, count});
  }
  // Most frequent first; ties by ascending code point.
  std::sort(kept.begin(), kept.end(),
            [](const CharCount& a, const CharCount& b) {
              if (a.count != b.count) return a.count > b.count;
              return a.code_point < b.code_point;
            });
  return kept;
}

}  // namespace

IdToChar invert(const CharToId& stoi) {
  IdToChar itos;
  itos.reserve(stoi.size());
  for (const auto& [token, id] : stoi) {
    itos[id] = token;
  }
  return itos;
}

bool is_bijection(const CharToId& stoi, const IdToChar& itos) {
  if (stoi.size() != itos.size()) return false;
  for (const auto& [token, id] : stoi) {
    auto it = itos.find(id);
    if (it == itos.end() || it->second != token) return false;
  }
  for (const auto& [id, token] : itos) {
    auto it = stoi.find(token);
    if (it == stoi.end() || it->second != id) return false;
  }
  return true;
}

CharTokenizer::CharTokenizer() : fs_(&default_file_system()) {}

CharTokenizer::CharTokenizer(FileSystem& fs) : fs_(&fs) {}

void CharTokenizer::fit(const CorpusSource& corpus, bool include_specials,
                        int min_freq) {
  if (is_fitted()) throw AlreadyFittedError();

  const std::string text = corpus.load(*fs_);
  const auto kept = count_characters(text, min_freq);
  if (kept.empty() && !include_specials) {
    throw EmptyVocabularyError(min_freq);
  }

  CharToId stoi;
  std::optional<TokenId> pad;
  std::optional<TokenId> unk;
  TokenId next = 0;
  if (include_specials) {
    pad = next;
    stoi.emplace(kPadToken, next++);
    unk = next;
    stoi.emplace(kUnkToken, next++);
  }
  for (const auto& entry : kept) {
    if (stoi.emplace(encode_utf8(entry.code_point), next).second) ++next;
  }

  IdToChar itos = invert(stoi);
  if (stoi.empty() || !is_bijection(stoi, itos)) {
    throw InternalInconsistencyError(
        "Internal mapping inconsistency after fit().");
  }

  char_to_id_ = std::move(stoi);
  id_to_char_ = std::move(itos);
  pad_id_ = pad;
  unk_id_ = unk;
}

std::vector<TokenId> CharTokenizer::encode(const std::string& text,
                                           bool strict) const {
  require_fitted("encode");
  const bool substitute = !strict && unk_id_.has_value();

  const auto code_points = decode_utf8(text);
  std::vector<TokenId> ids;
  ids.reserve(code_points.size());
  for (size_t pos = 0; pos < code_points.size(); ++pos) {
    std::string ch = encode_utf8(code_points[pos]);
    auto it = char_to_id_.find(ch);
    if (it != char_to_id_.end()) {
      ids.push_back(it->second);
    } else if (substitute) {
      ids.push_back(*unk_id_);
    } else {
      throw UnknownCharacterError(std::move(ch), pos);
    }
  }
  return ids;
}

std::string CharTokenizer::decode(const std::vector<TokenId>& ids,
                                  bool skip_specials) const {
  require_fitted("decode");
  const bool skip = skip_specials && pad_id_ && unk_id_;

  std::string text;
  text.reserve(ids.size());
  for (size_t pos = 0; pos < ids.size(); ++pos) {
    const TokenId id = ids[pos];
    if (skip && (id == *pad_id_ || id == *unk_id_)) continue;
    auto it = id_to_char_.find(id);
    if (it == id_to_char_.end()) throw UnknownIdError(id, pos);
    text += it->second;
  }
  return text;
}

std::size_t CharTokenizer::vocab_size() const {
  require_fitted("vocab_size");
  return char_to_id_.size();
}

std::optional<TokenId> CharTokenizer::find_id(const std::string& token) const {
  auto it = char_to_id_.find(token);
  if (it == char_to_id_.end()) return std::nullopt;
  return it->second;
}

VocabState CharTokenizer::state() const {
  return VocabState{char_to_id_, pad_id_, unk_id_};
}

void CharTokenizer::require_fitted(const char* operation) const {
  if (!is_fitted()) throw NotFittedError(operation);
}

}  // namespace chartok
