#pragma once

#include <string>
#include <vector>

namespace chartok {

// Strictly decodes UTF-8 into code points. Throws InvalidInputError with the
// byte offset of the first malformed sequence.
std::vector<char32_t> decode_utf8(const std::string& text);

std::string encode_utf8(char32_t code_point);

// "\r\n" and lone "\r" become "\n".
std::string normalize_newlines(const std::string& text);

// Escaped rendering of a token for diagnostics, e.g. "\n" -> "'\\n'".
std::string printable(const std::string& token);

}  // namespace chartok
