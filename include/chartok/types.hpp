#pragma once

#include <cstdint>

namespace chartok {

using TokenId = std::uint32_t;

// Literal markers for the two reserved vocabulary entries.
constexpr const char* kPadToken = "<PAD>";
constexpr const char* kUnkToken = "<UNK>";

constexpr const char* kFormatVersion = "char-tokenizer.v1";

}  // namespace chartok
