#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

#include "chartok/types.hpp"

namespace chartok {

enum class ErrorCode {
  AlreadyFitted,
  NotFitted,
  InvalidInput,
  EmptyVocabulary,
  InternalInconsistency,
  UnknownCharacter,
  UnknownId,
  CorruptState,
  FileNotFound,
  IoFailure,
};

const char* to_string(ErrorCode code);

/**
 * @class Error
 * @brief Base class for every failure raised by the tokenizer and its
 * file-system collaborator.
 *
 * Callers that only need to know *which* failure happened can catch Error and
 * switch on code(); callers that care about one condition catch the derived
 * class directly.
 */
class Error : public std::runtime_error {
 public:
  Error(ErrorCode code, const std::string& message);

  ErrorCode code() const { return code_; }

 private:
  ErrorCode code_;
};

class AlreadyFittedError : public Error {
 public:
  AlreadyFittedError();
};

class NotFittedError : public Error {
 public:
  explicit NotFittedError(const std::string& operation);
};

class InvalidInputError : public Error {
 public:
  explicit InvalidInputError(const std::string& message)
      : Error(ErrorCode::InvalidInput, message) {}
};

class EmptyVocabularyError : public Error {
 public:
  explicit EmptyVocabularyError(int min_freq);
};

class InternalInconsistencyError : public Error {
 public:
  explicit InternalInconsistencyError(const std::string& message)
      : Error(ErrorCode::InternalInconsistency, message) {}
};

// Strict encode hit a character that has no id.
class UnknownCharacterError : public Error {
 public:
  UnknownCharacterError(std::string character, std::size_t position);

  const std::string& character() const { return character_; }
  std::size_t position() const { return position_; }

 private:
  std::string character_;
  std::size_t position_;
};

// Decode hit an id that has no character.
class UnknownIdError : public Error {
 public:
  UnknownIdError(TokenId id, std::size_t position);

  TokenId id() const { return id_; }
  std::size_t position() const { return position_; }

 private:
  TokenId id_;
  std::size_t position_;
};

class CorruptStateError : public Error {
 public:
  explicit CorruptStateError(const std::string& message)
      : Error(ErrorCode::CorruptState, message) {}
};

class FileNotFoundError : public Error {
 public:
  explicit FileNotFoundError(const std::string& path);

  const std::string& path() const { return path_; }

 private:
  std::string path_;
};

class IoError : public Error {
 public:
  explicit IoError(const std::string& message)
      : Error(ErrorCode::IoFailure, message) {}
};

}  // namespace chartok
