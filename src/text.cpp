#include "deck/text.hpp"

#include <unicode/locid.h>
#include <unicode/stringpiece.h>
#include <unicode/unistr.h>

namespace deck::text {

std::string to_lower(const std::string& value) {
  icu::UnicodeString unicode = icu::UnicodeString::fromUTF8(icu::StringPiece(value));
  unicode.toLower(icu::Locale::getRoot());
  std::string lowered;
  unicode.toUTF8String(lowered);
  return lowered;
}

} // namespace deck::text
