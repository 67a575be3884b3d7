#include "chartok/tokenizer.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "chartok/corpus.hpp"
#include "chartok/errors.hpp"

using chartok::CharTokenizer;
using chartok::CorpusSource;
using chartok::TokenId;

namespace {

CharTokenizer fitted(const std::string& text, bool include_specials = true,
                     int min_freq = 1) {
  CharTokenizer tok;
  tok.fit(CorpusSource::text(text), include_specials, min_freq);
  return tok;
}

TokenId id_of(const CharTokenizer& tok, const std::string& token) {
  auto id = tok.find_id(token);
  EXPECT_TRUE(id.has_value()) << token;
  return id.value_or(0);
}

}  // namespace

TEST(CharTokenizerFit, RoundTripBasic) {
  auto tok = fitted("hello\n");
  auto ids = tok.encode("hello\n");
  EXPECT_EQ(ids.size(), 6u);
  EXPECT_EQ(tok.decode(ids), "hello\n");
}

TEST(CharTokenizerFit, SpecialsTakeFirstIds) {
  auto tok = fitted("ab");
  ASSERT_TRUE(tok.pad_id().has_value());
  ASSERT_TRUE(tok.unk_id().has_value());
  EXPECT_EQ(*tok.pad_id(), 0u);
  EXPECT_EQ(*tok.unk_id(), 1u);
  EXPECT_EQ(id_of(tok, "<PAD>"), 0u);
  EXPECT_EQ(id_of(tok, "<UNK>"), 1u);
  EXPECT_EQ(id_of(tok, "a"), 2u);
  EXPECT_EQ(id_of(tok, "b"), 3u);
  EXPECT_EQ(tok.vocab_size(), 4u);
}

TEST(CharTokenizerFit, OrdersByFrequencyThenCodePoint) {
  auto tok = fitted("abbccc");
  EXPECT_EQ(id_of(tok, "c"), 2u);
  EXPECT_EQ(id_of(tok, "b"), 3u);
  EXPECT_EQ(id_of(tok, "a"), 4u);

  auto ties = fitted("zyxzyx");
  EXPECT_EQ(id_of(ties, "x"), 2u);
  EXPECT_EQ(id_of(ties, "y"), 3u);
  EXPECT_EQ(id_of(ties, "z"), 4u);
}

TEST(CharTokenizerFit, WithoutSpecialsStartsAtZero) {
  auto tok = fitted("ba", false);
  EXPECT_FALSE(tok.pad_id().has_value());
  EXPECT_FALSE(tok.unk_id().has_value());
  EXPECT_EQ(id_of(tok, "a"), 0u);
  EXPECT_EQ(id_of(tok, "b"), 1u);
  EXPECT_EQ(tok.vocab_size(), 2u);
  EXPECT_FALSE(tok.find_id("<PAD>").has_value());
}

TEST(CharTokenizerFit, MinFreqFiltersCharactersButNotSpecials) {
  auto tok = fitted("aab", true, 2);
  EXPECT_EQ(tok.vocab_size(), 3u);
  EXPECT_EQ(id_of(tok, "a"), 2u);
  EXPECT_FALSE(tok.find_id("b").has_value());
  EXPECT_EQ(tok.encode("ab"), (std::vector<TokenId>{2, 1}));
}

TEST(CharTokenizerFit, EmptyCorpusWithSpecialsIsFitted) {
  auto tok = fitted("");
  EXPECT_TRUE(tok.is_fitted());
  EXPECT_EQ(tok.vocab_size(), 2u);
  EXPECT_TRUE(tok.encode("").empty());
  EXPECT_EQ(tok.encode("q"), (std::vector<TokenId>{1}));
}

TEST(CharTokenizerFit, EmptyVocabularyWithoutSpecialsThrows) {
  CharTokenizer tok;
  EXPECT_THROW(tok.fit(CorpusSource::text("ab"), false, 5),
               chartok::EmptyVocabularyError);
  EXPECT_THROW(tok.fit(CorpusSource::text(""), false),
               chartok::EmptyVocabularyError);
  EXPECT_FALSE(tok.is_fitted());

  // A failed fit leaves the instance fittable.
  tok.fit(CorpusSource::text("ab"), false);
  EXPECT_EQ(tok.vocab_size(), 2u);
}

TEST(CharTokenizerFit, RefitIsRejected) {
  auto tok = fitted("abc");
  try {
    tok.fit(CorpusSource::text("xyz"));
    FAIL() << "expected AlreadyFittedError";
  } catch (const chartok::AlreadyFittedError& e) {
    EXPECT_EQ(e.code(), chartok::ErrorCode::AlreadyFitted);
  }
  EXPECT_TRUE(tok.find_id("a").has_value());
  EXPECT_FALSE(tok.find_id("x").has_value());
}

TEST(CharTokenizerFit, IsDeterministic) {
  const std::string corpus = "the quick brown fox jumps over the lazy dog\n";
  auto first = fitted(corpus);
  auto second = fitted(corpus);
  EXPECT_EQ(first.char_to_id(), second.char_to_id());
  EXPECT_EQ(first.id_to_char(), second.id_to_char());
}

TEST(CharTokenizerFit, MappingsAreInverse) {
  auto tok = fitted("Mississippi river, 1843.\n\tEnd");
  const auto& stoi = tok.char_to_id();
  const auto& itos = tok.id_to_char();
  ASSERT_EQ(stoi.size(), itos.size());
  for (const auto& [token, id] : stoi) {
    EXPECT_EQ(itos.at(id), token);
  }
  for (const auto& [id, token] : itos) {
    EXPECT_EQ(stoi.at(token), id);
  }
  EXPECT_TRUE(chartok::is_bijection(stoi, itos));
}

TEST(CharTokenizerFit, MultiByteCharactersAreSingleTokens) {
  auto tok = fitted("h\xC3\xA9\xC3\xA9\xE2\x82\xAC");  // h é é €
  EXPECT_EQ(tok.vocab_size(), 5u);
  EXPECT_EQ(id_of(tok, "\xC3\xA9"), 2u);
  EXPECT_EQ(id_of(tok, "h"), 3u);
  EXPECT_EQ(id_of(tok, "\xE2\x82\xAC"), 4u);

  auto ids = tok.encode("\xC3\xA9h");
  EXPECT_EQ(ids, (std::vector<TokenId>{2, 3}));
  EXPECT_EQ(tok.decode(ids), "\xC3\xA9h");
}

TEST(CharTokenizerFit, InvalidUtf8CorpusIsInvalidInput) {
  CharTokenizer tok;
  EXPECT_THROW(tok.fit(CorpusSource::text("ab\xFF")),
               chartok::InvalidInputError);
  EXPECT_FALSE(tok.is_fitted());
}

TEST(CharTokenizerEncode, SubstitutesUnknownId) {
  auto tok = fitted("ab");
  EXPECT_EQ(tok.encode("abc"), (std::vector<TokenId>{2, 3, 1}));
}

TEST(CharTokenizerEncode, StrictReportsCharacterAndPosition) {
  auto tok = fitted("ab");
  try {
    tok.encode("ab\xC3\xA9", true);
    FAIL() << "expected UnknownCharacterError";
  } catch (const chartok::UnknownCharacterError& e) {
    EXPECT_EQ(e.character(), "\xC3\xA9");
    EXPECT_EQ(e.position(), 2u);
    EXPECT_EQ(e.code(), chartok::ErrorCode::UnknownCharacter);
  }
}

TEST(CharTokenizerEncode, NoUnknownIdBehavesStrict) {
  auto tok = fitted("ab", false);
  EXPECT_THROW(tok.encode("abc"), chartok::UnknownCharacterError);
  EXPECT_EQ(tok.encode("ba"), (std::vector<TokenId>{1, 0}));
}

TEST(CharTokenizerEncode, SpecialMarkersAreNotMatchedAsText) {
  auto tok = fitted("<PAD>");
  auto ids = tok.encode("<PAD>");
  EXPECT_EQ(ids.size(), 5u);
  for (TokenId id : ids) {
    EXPECT_NE(id, *tok.pad_id());
  }
}

TEST(CharTokenizerDecode, SkipsSpecials) {
  auto tok = fitted("ab");
  std::vector<TokenId> sample = {*tok.pad_id(), id_of(tok, "a"),
                                 *tok.unk_id(), id_of(tok, "b")};
  EXPECT_EQ(tok.decode(sample, true), "ab");
  EXPECT_EQ(tok.decode(sample, false), "<PAD>a<UNK>b");
  EXPECT_EQ(tok.decode({0, 1, 0}), "");
}

TEST(CharTokenizerDecode, UnknownIdThrows) {
  auto tok = fitted("ab");
  try {
    tok.decode({2, 999999});
    FAIL() << "expected UnknownIdError";
  } catch (const chartok::UnknownIdError& e) {
    EXPECT_EQ(e.id(), 999999u);
    EXPECT_EQ(e.position(), 1u);
    EXPECT_EQ(e.code(), chartok::ErrorCode::UnknownId);
  }
  EXPECT_THROW(tok.decode({999999}, false), chartok::UnknownIdError);
}

TEST(CharTokenizerDecode, WithoutSpecialsEveryIdIsRendered) {
  auto tok = fitted("ab", false);
  EXPECT_EQ(tok.decode({0, 1, 0}, true), "aba");
}

TEST(CharTokenizerState, UnfittedRejectsReads) {
  CharTokenizer tok;
  EXPECT_FALSE(tok.is_fitted());
  EXPECT_THROW(tok.encode("a"), chartok::NotFittedError);
  EXPECT_THROW(tok.decode({0}), chartok::NotFittedError);
  EXPECT_THROW(tok.vocab_size(), chartok::NotFittedError);
  EXPECT_THROW(tok.persist("/tmp/never_written.json"),
               chartok::NotFittedError);
}

TEST(CharTokenizerState, ErrorsShareBaseClass) {
  CharTokenizer tok;
  try {
    tok.encode("a");
    FAIL() << "expected chartok::Error";
  } catch (const chartok::Error& e) {
    EXPECT_EQ(e.code(), chartok::ErrorCode::NotFitted);
    EXPECT_STREQ(chartok::to_string(e.code()), "NotFitted");
  }
}
