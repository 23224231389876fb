#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace resolver::normalize {

/*
  Field canonicalization.

  All functions are total and deterministic: any byte string is accepted,
  empty input yields empty (or absent) output.
*/

// Upper-cased; separators dropped; other punctuation becomes a word break;
// whitespace collapsed and trimmed. "AGM14NV-412341 4111 ea" -> "AGM14NV412341 4111 EA".
std::string NormalizePartNumber(std::string_view raw);

// Upper-cased words with trailing corporate suffixes stripped
// ("3M Company" -> "3M"). The last remaining word is never stripped.
std::string NormalizeManufacturer(std::string_view raw);

// Exactly eight digits once whitespace is removed, otherwise absent.
std::optional<std::string> NormalizeUnspsc(std::string_view raw);

// Whitespace removed and upper-cased; blank and placeholder values are absent.
std::optional<std::string> NormalizeGtin(std::string_view raw);

// Lower-case alphanumeric words, in input order, duplicates kept.
std::vector<std::string> Tokenize(std::string_view text);

bool IsCorporateSuffix(std::string_view upper_token);

} // namespace resolver::normalize
