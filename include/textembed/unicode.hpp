#pragma once

#include <string>
#include <string_view>

namespace textembed::internal {

/**
 * Decode UTF-8 into code points.
 * Malformed sequences decode to U+FFFD, one per offending byte.
 */
std::u32string DecodeUtf8(std::string_view text);

std::string EncodeUtf8(std::u32string_view text);

void AppendUtf8(char32_t cp, std::string* out);

// Character classes backed by the ICU character database. Whitespace,
// control and punctuation follow the definitions used by BERT-style
// tokenizers.
bool IsWhitespace(char32_t cp);
bool IsControl(char32_t cp);
bool IsPunctuation(char32_t cp);
bool IsChineseChar(char32_t cp);
bool IsCombiningMark(char32_t cp);  // nonspacing marks (Mn)
bool IsDigit(char32_t cp);          // any numeric category
bool IsWordChar(char32_t cp);       // \w: letters, marks, digits, connectors

/** Full Unicode lowercase mapping; the result may change length. */
std::u32string ToLower(std::u32string_view text);

enum class NormalizationForm { kNFD, kNFKD, kNFC, kNFKC };

/**
 * Applies a Unicode normalization form.
 * Throws std::runtime_error if ICU cannot load its normalization data.
 */
std::u32string Normalize(std::u32string_view text, NormalizationForm form);

}  // namespace textembed::internal
