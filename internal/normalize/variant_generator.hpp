#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace resolver::normalize {

constexpr std::size_t kDefaultMaxVariants = 10;

/*
  VariantGenerator

  Expands a normalized part number into alternate spellings:

    1. the input itself (always first, never filtered)
    2. compact form (spaces removed)
    3. trailing unit/packaging/revision words removed, spaced and compact
    4. a leading 2-6 letter prefix word dropped (e.g. "HP CF226A")
    5. a 2-6 letter prefix glued to digits dropped ("ETN120..." -> "120...")
       when it is one of ManufacturerPrefixes(manufacturer), or either is a
       prefix of the other; any such prefix when the manufacturer is unknown
    6. last word moved to the front
    7. OCR confusions of the compact forms (O->0, I/L->1)

  Duplicates keep their first position. Variants much shorter than the input
  are filtered, then the list is cut to max_variants (at least 1).
*/
class VariantGenerator {
 public:
  explicit VariantGenerator(std::size_t max_variants = kDefaultMaxVariants);

  // `manufacturer` is the canonical identity of the record's manufacturer.
  std::vector<std::string> Generate(std::string_view normalized, std::string_view manufacturer = {}) const;

  std::size_t max_variants() const {
    return max_variants_;
  }

 private:
  std::size_t max_variants_;
};

// True when `variant` is too short relative to `original` to be a useful match key.
bool IsShortVariant(std::string_view variant, std::string_view original);

// Abbreviations a manufacturer is likely to stamp in front of its part
// numbers: leading letters, consonant skeleton, initials, first+last letters
// and syllable heads, 2-6 letters, best first, at most eight plus the first
// word of the name. "EATON" gives EN, ET, EA, ETN, EAT, EON, EATO, EATON.
std::vector<std::string> ManufacturerPrefixes(std::string_view manufacturer);

// Unit, packaging or revision tail ("EA", "-PK", "REV2") or a single letter.
bool IsUnitSuffix(std::string_view suffix);

} // namespace resolver::normalize
