#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "chartok/corpus.hpp"
#include "chartok/serialization.hpp"
#include "chartok/types.hpp"

namespace chartok {

class FileSystem;

// Inverse of @p stoi. Duplicate ids collapse, which is_bijection() detects.
IdToChar invert(const CharToId& stoi);

// True when each mapping is the exact inverse of the other.
bool is_bijection(const CharToId& stoi, const IdToChar& itos);

/**
 * @class CharTokenizer
 * @brief Bidirectional character <-> id vocabulary built from a corpus.
 *
 * An instance starts unfitted and becomes fitted exactly once through fit(),
 * or through restore(), which may replace any existing state. After that the
 * vocabulary never changes, so a fitted instance can be shared read-only.
 *
 * Characters are Unicode code points carried as their UTF-8 encoding. The two
 * optional specials are stored under the literal keys "<PAD>" and "<UNK>".
 */
class CharTokenizer {
 public:
  CharTokenizer();

  // The tokenizer keeps a reference to @p fs; it must outlive the instance
  // and every copy made of it.
  explicit CharTokenizer(FileSystem& fs);

  // Builds a new instance from a persisted vocabulary. The overload taking
  // @p fs has the same lifetime requirement as the constructor.
  static CharTokenizer from_file(const std::string& path);
  static CharTokenizer from_file(const std::string& path, FileSystem& fs);

  /**
   * @brief Builds the vocabulary.
   *
   * Characters seen at least @p min_freq times get ids in order of descending
   * frequency, ties broken by ascending code point. With @p include_specials,
   * <PAD> takes id 0 and <UNK> id 1 and characters start at 2.
   *
   * @throws AlreadyFittedError, InvalidInputError, EmptyVocabularyError,
   * InternalInconsistencyError. The instance is untouched on failure.
   */
  void fit(const CorpusSource& corpus, bool include_specials = true,
           int min_freq = 1);

  /**
   * @brief One id per character of @p text.
   *
   * Unknown characters map to the unknown id unless @p strict is set or the
   * vocabulary has no unknown id, in which case UnknownCharacterError is
   * thrown.
   */
  std::vector<TokenId> encode(const std::string& text,
                              bool strict = false) const;

  /**
   * @brief Concatenates the characters of @p ids.
   *
   * With @p skip_specials and both specials configured, pad and unknown ids
   * are dropped. Otherwise specials render as their marker text. An id
   * outside the vocabulary throws UnknownIdError.
   */
  std::string decode(const std::vector<TokenId>& ids,
                     bool skip_specials = true) const;

  std::size_t vocab_size() const;
  bool is_fitted() const {
    return !char_to_id_.empty() && !id_to_char_.empty();
  }

  std::optional<TokenId> pad_id() const { return pad_id_; }
  std::optional<TokenId> unk_id() const { return unk_id_; }
  const CharToId& char_to_id() const { return char_to_id_; }
  const IdToChar& id_to_char() const { return id_to_char_; }

  // Id of a single character or special marker.
  std::optional<TokenId> find_id(const std::string& token) const;

  // Atomically writes the vocabulary to @p path as JSON.
  void persist(const std::string& path) const;

  // Replaces the current state with the vocabulary stored at @p path.
  void restore(const std::string& path);

  VocabState state() const;

 private:
  void require_fitted(const char* operation) const;

  FileSystem* fs_;
  CharToId char_to_id_;
  IdToChar id_to_char_;
  std::optional<TokenId> pad_id_;
  std::optional<TokenId> unk_id_;
};

}  // namespace chartok
