#include "normalizer.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace resolver::normalize {
namespace {

constexpr std::string_view kDroppedPartNumberChars = "-_/.,;:#'\"()[]{}*+\\";

constexpr std::array<std::string_view, 35> kCorporateSuffixes = {
    "INC",        "LLC",         "LTD",      "LIMITED",  "CO",          "CORP",          "CORPORATION",
    "GMBH",       "AG",          "BV",       "SA",       "SAS",         "PLC",           "PTE",
    "PTY",        "AB",          "OY",       "KK",       "SPA",         "SRL",           "TECHNOLOGIES",
    "SYSTEMS",    "SOLUTIONS",   "SERVICES", "ENTERPRISES", "INDUSTRIES", "INTERNATIONAL", "WORLDWIDE",
    "GLOBAL",     "GROUP",       "COMPANY",  "COMPANIES", "INCORPORATED", "HOLDINGS",    "MFG"};

constexpr std::array<std::string_view, 5> kGtinPlaceholders = {"", "0", "NAN", "NONE", "NULL"};

bool IsAlnum(unsigned char c) {
  return std::isalnum(c) != 0;
}

char Upper(unsigned char c) {
  return static_cast<char>(std::toupper(c));
}

// Collapses runs of spaces and trims both ends.
std::string CollapseSpaces(const std::string& in) {
  std::string out;
  out.reserve(in.size());
  bool pending_space = false;
  for (char c : in) {
    if (c == ' ') {
      pending_space = !out.empty();
      continue;
    }
    if (pending_space) {
      out.push_back(' ');
      pending_space = false;
    }
    out.push_back(c);
  }
  return out;
}

std::vector<std::string> SplitWords(const std::string& text) {
  std::vector<std::string> words;
  std::size_t              start = 0;
  while (start < text.size()) {
    auto end = text.find(' ', start);
    if (end == std::string::npos) end = text.size();
    if (end > start) words.emplace_back(text.substr(start, end - start));
    start = end + 1;
  }
  return words;
}

} // namespace

bool IsCorporateSuffix(std::string_view upper_token) {
  return std::find(kCorporateSuffixes.begin(), kCorporateSuffixes.end(), upper_token) != kCorporateSuffixes.end();
}

std::string NormalizePartNumber(std::string_view raw) {
  std::string folded;
  folded.reserve(raw.size());
  for (unsigned char c : raw) {
    if (kDroppedPartNumberChars.find(static_cast<char>(c)) != std::string_view::npos) {
      continue;
    }
    folded.push_back(IsAlnum(c) ? Upper(c) : ' ');
  }
  return CollapseSpaces(folded);
}

std::string NormalizeManufacturer(std::string_view raw) {
  std::string folded;
  folded.reserve(raw.size() + 8);
  for (unsigned char c : raw) {
    if (c == '&') {
      folded += " AND ";
    } else if (c == '\'' || c == '.') {
      // "L'OREAL", "S.A." keep their letters together
      continue;
    } else {
      folded.push_back(IsAlnum(c) ? Upper(c) : ' ');
    }
  }

  auto words = SplitWords(CollapseSpaces(folded));
  while (words.size() > 1 && IsCorporateSuffix(words.back())) {
    words.pop_back();
  }

  std::string out;
  for (const auto& word : words) {
    if (!out.empty()) out.push_back(' ');
    out += word;
  }
  return out;
}

std::optional<std::string> NormalizeUnspsc(std::string_view raw) {
  std::string digits;
  for (unsigned char c : raw) {
    if (std::isspace(c)) continue;
    if (!std::isdigit(c)) return std::nullopt;
    digits.push_back(static_cast<char>(c));
  }
  if (digits.size() != 8) return std::nullopt;
  return digits;
}

std::optional<std::string> NormalizeGtin(std::string_view raw) {
  std::string out;
  for (unsigned char c : raw) {
    if (std::isspace(c)) continue;
    out.push_back(Upper(c));
  }
  if (std::find(kGtinPlaceholders.begin(), kGtinPlaceholders.end(), out) != kGtinPlaceholders.end()) {
    return std::nullopt;
  }
  return out;
}

std::vector<std::string> Tokenize(std::string_view text) {
  std::vector<std::string> tokens;
  std::string              current;
  for (unsigned char c : text) {
    if (IsAlnum(c)) {
      current.push_back(static_cast<char>(std::tolower(c)));
    } else if (!current.empty()) {
      tokens.push_back(std::move(current));
      current.clear();
    }
  }
  if (!current.empty()) tokens.push_back(std::move(current));
  return tokens;
}

} // namespace resolver::normalize
