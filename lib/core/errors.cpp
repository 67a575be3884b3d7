#include "chartok/errors.hpp"

#include <string>
#include <utility>

#include "chartok/utf8.hpp"

namespace chartok {

const char* to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::AlreadyFitted:
      return "AlreadyFitted";
    case ErrorCode::NotFitted:
      return "NotFitted";
    case ErrorCode::InvalidInput:
      return "InvalidInput";
    case ErrorCode::EmptyVocabulary:
      return "EmptyVocabulary";
    case ErrorCode::InternalInconsistency:
      return "InternalInconsistency";
    case ErrorCode::UnknownCharacter:
      return "UnknownCharacter";
    case ErrorCode::UnknownId:
      return "UnknownId";
    case ErrorCode::CorruptState:
      return "CorruptState";
    case ErrorCode::FileNotFound:
      return "FileNotFound";
    case ErrorCode::IoFailure:
      return "IOFailure";
  }
  return "Unknown";
}

Error::Error(ErrorCode code, const std::string& message)
    : std::runtime_error(message), code_(code) {}

AlreadyFittedError::AlreadyFittedError()
    : Error(ErrorCode::AlreadyFitted,
            "Tokenizer is already fitted. Create a new instance to fit "
            "again.") {}

NotFittedError::NotFittedError(const std::string& operation)
    : Error(ErrorCode::NotFitted,
            "Tokenizer not fitted. Call fit(...) before " + operation + "().") {
}

EmptyVocabularyError::EmptyVocabularyError(int min_freq)
    : Error(ErrorCode::EmptyVocabulary,
            "No characters meet the frequency threshold (min_freq=" +
                std::to_string(min_freq) + "); cannot build vocab.") {}

UnknownCharacterError::UnknownCharacterError(std::string character,
                                             std::size_t position)
    : Error(ErrorCode::UnknownCharacter,
            "Character " + printable(character) + " at position " +
                std::to_string(position) + " is not in the vocabulary"),
      character_(std::move(character)),
      position_(position) {}

UnknownIdError::UnknownIdError(TokenId id, std::size_t position)
    : Error(ErrorCode::UnknownId, "Token id " + std::to_string(id) +
                                      " at position " +
                                      std::to_string(position) +
                                      " is not in the vocabulary"),
      id_(id),
      position_(position) {}

FileNotFoundError::FileNotFoundError(const std::string& path)
    : Error(ErrorCode::FileNotFound, "No such file: '" + path + "'"),
      path_(path) {}

}  // namespace chartok
