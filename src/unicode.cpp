#include <textembed/unicode.hpp>

#include <unicode/locid.h>
#include <unicode/normalizer2.h>
#include <unicode/uchar.h>
#include <unicode/unistr.h>

#include <cstdint>
#include <stdexcept>

namespace textembed::internal {

namespace {

constexpr char32_t kReplacementChar = 0xFFFD;

bool InRange(char32_t cp, char32_t lo, char32_t hi) {
  return cp >= lo && cp <= hi;
}

int8_t CharType(char32_t cp) {
  return u_charType(static_cast<UChar32>(cp));
}

icu::UnicodeString ToIcu(std::u32string_view text) {
  return icu::UnicodeString::fromUTF32(
      reinterpret_cast<const UChar32*>(text.data()),
      static_cast<int32_t>(text.size()));
}

std::u32string FromIcu(const icu::UnicodeString& text) {
  std::u32string out;
  out.reserve(static_cast<size_t>(text.length()));
  for (int32_t i = 0; i < text.length();) {
    UChar32 cp = text.char32At(i);
    out.push_back(static_cast<char32_t>(cp));
    i += U16_LENGTH(cp);
  }
  return out;
}

const icu::Normalizer2* NormalizerFor(NormalizationForm form,
                                      UErrorCode* status) {
  switch (form) {
    case NormalizationForm::kNFD:
      return icu::Normalizer2::getNFDInstance(*status);
    case NormalizationForm::kNFKD:
      return icu::Normalizer2::getNFKDInstance(*status);
    case NormalizationForm::kNFC:
      return icu::Normalizer2::getNFCInstance(*status);
    case NormalizationForm::kNFKC:
      return icu::Normalizer2::getNFKCInstance(*status);
  }
  *status = U_ILLEGAL_ARGUMENT_ERROR;
  return nullptr;
}

}  // namespace

std::u32string DecodeUtf8(std::string_view text) {
  std::u32string out;
  out.reserve(text.size());

  size_t i = 0;
  while (i < text.size()) {
    uint8_t c = static_cast<uint8_t>(text[i]);
    if (c < 0x80) {
      out.push_back(c);
      ++i;
      continue;
    }

    size_t len = 0;
    char32_t cp = 0;
    if ((c & 0xE0) == 0xC0) {
      len = 2;
      cp = c & 0x1F;
    } else if ((c & 0xF0) == 0xE0) {
      len = 3;
      cp = c & 0x0F;
    } else if ((c & 0xF8) == 0xF0) {
      len = 4;
      cp = c & 0x07;
    } else {
      out.push_back(kReplacementChar);
      ++i;
      continue;
    }

    if (i + len > text.size()) {
      out.push_back(kReplacementChar);
      ++i;
      continue;
    }

    bool valid = true;
    for (size_t j = 1; j < len; ++j) {
      uint8_t cc = static_cast<uint8_t>(text[i + j]);
      if ((cc & 0xC0) != 0x80) {
        valid = false;
        break;
      }
      cp = (cp << 6) | (cc & 0x3F);
    }

    if (!valid || cp > 0x10FFFF) {
      out.push_back(kReplacementChar);
      ++i;
      continue;
    }

    out.push_back(cp);
    i += len;
  }

  return out;
}

void AppendUtf8(char32_t cp, std::string* out) {
  if (cp < 0x80) {
    out->push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out->push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out->push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out->push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out->push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out->push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out->push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out->push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out->push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out->push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

std::string EncodeUtf8(std::u32string_view text) {
  std::string out;
  out.reserve(text.size());
  for (char32_t cp : text) {
    AppendUtf8(cp, &out);
  }
  return out;
}

bool IsWhitespace(char32_t cp) {
  return cp == '\t' || cp == '\n' || cp == '\r' ||
         u_isUWhiteSpace(static_cast<UChar32>(cp));
}

bool IsControl(char32_t cp) {
  // Tab, newline and carriage return count as whitespace.
  if (cp == '\t' || cp == '\n' || cp == '\r') return false;
  switch (CharType(cp)) {
    case U_CONTROL_CHAR:
    case U_FORMAT_CHAR:
    case U_UNASSIGNED:
    case U_PRIVATE_USE_CHAR:
    case U_SURROGATE:
      return true;
    default:
      return false;
  }
}

bool IsPunctuation(char32_t cp) {
  // ASCII punctuation is treated as punctuation even where Unicode calls it
  // a symbol ("^", "$", "`").
  if (InRange(cp, 33, 47) || InRange(cp, 58, 64) || InRange(cp, 91, 96) ||
      InRange(cp, 123, 126)) {
    return true;
  }
  return u_ispunct(static_cast<UChar32>(cp));
}

bool IsChineseChar(char32_t cp) {
  // CJK Unified Ideographs and related blocks
  return InRange(cp, 0x4E00, 0x9FFF) || InRange(cp, 0x3400, 0x4DBF) ||
         InRange(cp, 0x20000, 0x2A6DF) || InRange(cp, 0x2A700, 0x2B73F) ||
         InRange(cp, 0x2B740, 0x2B81F) || InRange(cp, 0x2B820, 0x2CEAF) ||
         InRange(cp, 0xF900, 0xFAFF) || InRange(cp, 0x2F800, 0x2FA1F);
}

bool IsCombiningMark(char32_t cp) {
  return CharType(cp) == U_NON_SPACING_MARK;
}

bool IsDigit(char32_t cp) {
  int8_t type = CharType(cp);
  return type == U_DECIMAL_DIGIT_NUMBER || type == U_LETTER_NUMBER ||
         type == U_OTHER_NUMBER;
}

bool IsWordChar(char32_t cp) {
  if (cp < 0x80) {
    return InRange(cp, '0', '9') || InRange(cp, 'a', 'z') ||
           InRange(cp, 'A', 'Z') || cp == '_';
  }
  switch (CharType(cp)) {
    case U_NON_SPACING_MARK:
    case U_ENCLOSING_MARK:
    case U_COMBINING_SPACING_MARK:
    case U_DECIMAL_DIGIT_NUMBER:
    case U_CONNECTOR_PUNCTUATION:
      return true;
    default:
      return u_isalpha(static_cast<UChar32>(cp));
  }
}

std::u32string ToLower(std::u32string_view text) {
  icu::UnicodeString s = ToIcu(text);
  s.toLower(icu::Locale::getRoot());
  return FromIcu(s);
}

std::u32string Normalize(std::u32string_view text, NormalizationForm form) {
  UErrorCode status = U_ZERO_ERROR;
  const icu::Normalizer2* normalizer = NormalizerFor(form, &status);
  if (U_FAILURE(status)) {
    throw std::runtime_error(std::string("ICU normalizer unavailable: ") +
                             u_errorName(status));
  }
  icu::UnicodeString out = normalizer->normalize(ToIcu(text), status);
  if (U_FAILURE(status)) {
    throw std::runtime_error(std::string("ICU normalization failed: ") +
                             u_errorName(status));
  }
  return FromIcu(out);
}

}  // namespace textembed::internal
