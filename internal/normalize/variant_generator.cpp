#include "variant_generator.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <unordered_set>

namespace resolver::normalize {
namespace {

constexpr std::array<std::string_view, 22> kTrailingNoiseWords = {
    "EA",    "EACH", "PCS",   "PC",   "PIECE", "PIECES", "PK",       "PACK",     "UNIT",
    "UNITS", "CT",   "COUNT", "QTY",  "BULK",  "RETAIL", "STD",      "STANDARD", "NEW",
    "OLD",   "ORIGINAL", "REPLACEMENT", "REFURB"};

constexpr std::size_t kMinStrippedLength = 3;

constexpr std::size_t kMinPrefixLength      = 2;
constexpr std::size_t kMaxPrefixLength      = 6;
constexpr std::size_t kMaxGeneratedPrefixes = 8;

bool IsAllDigits(std::string_view s) {
  return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

bool IsAllAlpha(std::string_view s) {
  return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isalpha(c) != 0; });
}

// REV2, V1, R10 style revision markers.
bool IsRevisionWord(std::string_view word) {
  for (std::string_view prefix : {std::string_view("REV"), std::string_view("V"), std::string_view("R")}) {
    if (word.size() <= prefix.size() || word.substr(0, prefix.size()) != prefix) continue;
    auto digits = word.substr(prefix.size());
    if (digits.size() <= 3 && IsAllDigits(digits)) return true;
  }
  return false;
}

bool IsTrailingNoise(std::string_view word) {
  return IsRevisionWord(word) ||
         std::find(kTrailingNoiseWords.begin(), kTrailingNoiseWords.end(), word) != kTrailingNoiseWords.end();
}

bool IsVowel(char c) {
  return c == 'A' || c == 'E' || c == 'I' || c == 'O' || c == 'U';
}

std::size_t LeadingLetters(std::string_view s) {
  std::size_t n = 0;
  while (n < s.size() && std::isalpha(static_cast<unsigned char>(s[n])) != 0) ++n;
  return n;
}

bool PrefixMatches(const std::string& prefix, const std::vector<std::string>& known) {
  for (const auto& k : known) {
    if (prefix == k) return true;
    if (prefix.compare(0, k.size(), k) == 0 || k.compare(0, prefix.size(), prefix) == 0) return true;
  }
  return false;
}

std::vector<std::string> SplitWords(std::string_view text) {
  std::vector<std::string> words;
  std::size_t              start = 0;
  while (start < text.size()) {
    auto end = text.find(' ', start);
    if (end == std::string_view::npos) end = text.size();
    if (end > start) words.emplace_back(text.substr(start, end - start));
    start = end + 1;
  }
  return words;
}

std::string Join(const std::vector<std::string>& words, std::size_t first, std::size_t last, std::string_view sep) {
  std::string out;
  for (std::size_t i = first; i < last; ++i) {
    if (i > first) out += sep;
    out += words[i];
  }
  return out;
}

std::string Compact(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    if (c != ' ') out.push_back(c);
  }
  return out;
}

std::string OcrFold(std::string_view s) {
  std::string out(s);
  for (auto& c : out) {
    if (c == 'O') c = '0';
    else if (c == 'I' || c == 'L') c = '1';
  }
  return out;
}

} // namespace

std::vector<std::string> ManufacturerPrefixes(std::string_view manufacturer) {
  std::string name;
  for (char c : manufacturer) {
    if (c == '-' || c == '_') c = ' ';
    name.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
  }
  const auto words = SplitWords(name);
  if (words.empty()) return {};

  name = Join(words, 0, words.size(), " ");
  std::unordered_set<std::string> candidates;
  auto add = [&candidates](std::string p) {
    if (p.size() >= kMinPrefixLength && p.size() <= kMaxPrefixLength && IsAllAlpha(p)) candidates.insert(std::move(p));
  };

  std::string consonants;
  for (char c : name) {
    if (std::isalpha(static_cast<unsigned char>(c)) != 0 && !IsVowel(c)) consonants.push_back(c);
  }

  std::string syllables(1, name.front());
  for (std::size_t i = 1; i < name.size(); ++i) {
    if (IsVowel(name[i - 1]) && !IsVowel(name[i]) && name[i] != ' ') syllables.push_back(name[i]);
  }

  for (std::size_t n = kMinPrefixLength; n <= kMaxPrefixLength; ++n) {
    if (name.size() >= n) add(name.substr(0, n));
    if (consonants.size() >= n) add(consonants.substr(0, n));
    if (syllables.size() >= n) add(syllables.substr(0, n));
  }

  if (words.size() > 1) {
    std::string initials;
    for (const auto& word : words) initials.push_back(word.front());
    add(initials.substr(0, kMaxPrefixLength));
  }

  if (name.size() > 2) add(std::string{name.front(), name.back()});
  if (name.size() > 3) add(name.front() + name.substr(name.size() - 2));

  // shorter, same first letter, consonant-heavy first
  auto rank = [&name](const std::string& p) {
    int score = static_cast<int>(kMaxPrefixLength - p.size()) * 2;
    score += p.front() == name.front() ? 5 : -10;
    score += static_cast<int>(std::count_if(p.begin(), p.end(), [](char c) { return !IsVowel(c); }));
    return score;
  };

  std::vector<std::string> prefixes(candidates.begin(), candidates.end());
  std::sort(prefixes.begin(), prefixes.end(), [&rank](const std::string& a, const std::string& b) {
    const int ra = rank(a);
    const int rb = rank(b);
    return ra != rb ? ra > rb : a < b;
  });
  if (prefixes.size() > kMaxGeneratedPrefixes) prefixes.resize(kMaxGeneratedPrefixes);

  if (std::find(prefixes.begin(), prefixes.end(), words.front()) == prefixes.end()) prefixes.push_back(words.front());
  return prefixes;
}

bool IsUnitSuffix(std::string_view suffix) {
  const auto start = suffix.find_first_not_of(" -_/.");
  if (start == std::string_view::npos) return false;

  std::string word(suffix.substr(start));
  while (!word.empty() && word.back() == ' ') word.pop_back();
  for (auto& c : word) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));

  if (word.size() == 1) return IsAllAlpha(word);
  return IsTrailingNoise(word);
}

bool IsShortVariant(std::string_view variant, std::string_view original) {
  const auto original_length = Compact(original).size();
  const auto variant_length  = Compact(variant).size();

  if (original_length <= 5) return false;
  if (original_length <= 8) return variant_length <= 3;
  if (original_length <= 12) return variant_length <= 4;
  return static_cast<double>(variant_length) < 0.4 * static_cast<double>(original_length);
}

VariantGenerator::VariantGenerator(std::size_t max_variants) : max_variants_(std::max<std::size_t>(max_variants, 1)) {
}

std::vector<std::string> VariantGenerator::Generate(std::string_view normalized, std::string_view manufacturer) const {
  const std::string original(normalized);

  std::vector<std::string> candidates;
  candidates.push_back(original);
  candidates.push_back(Compact(original));

  auto words = SplitWords(original);

  // trailing unit / packaging / revision words
  auto core = words;
  while (core.size() > 1 && IsTrailingNoise(core.back())) {
    auto spaced = Join(core, 0, core.size() - 1, " ");
    if (Compact(spaced).size() < kMinStrippedLength) break;
    core.pop_back();
    candidates.push_back(spaced);
    candidates.push_back(Compact(spaced));
  }

  // manufacturer-style prefix word
  for (const auto* base : {&words, &core}) {
    if (base->size() < 2) continue;
    const auto& head = base->front();
    if (head.size() < 2 || head.size() > 6 || !IsAllAlpha(head)) continue;
    auto rest = Join(*base, 1, base->size(), " ");
    candidates.push_back(rest);
    candidates.push_back(Compact(rest));
  }

  // manufacturer prefix glued to the part number proper
  const auto known = ManufacturerPrefixes(manufacturer);
  for (const auto* base : {&words, &core}) {
    if (base->empty()) continue;
    const auto& head    = base->front();
    const auto  letters = LeadingLetters(head);
    if (letters < kMinPrefixLength || letters > kMaxPrefixLength || letters == head.size()) continue;
    if (std::isdigit(static_cast<unsigned char>(head[letters])) == 0) continue;
    if (!known.empty() && !PrefixMatches(head.substr(0, letters), known)) continue;

    auto rest = head.substr(letters);
    if (base->size() > 1) rest += " " + Join(*base, 1, base->size(), " ");
    if (Compact(rest).size() < 2) continue;
    candidates.push_back(rest);
    candidates.push_back(Compact(rest));
  }

  // group reordering: last group to the front
  if (core.size() >= 2) {
    std::vector<std::string> rotated;
    rotated.push_back(core.back());
    rotated.insert(rotated.end(), core.begin(), core.end() - 1);
    auto spaced = Join(rotated, 0, rotated.size(), " ");
    candidates.push_back(spaced);
    candidates.push_back(Compact(spaced));
  }

  // OCR confusions of every compact form produced so far
  const auto pre_ocr = candidates.size();
  for (std::size_t i = 0; i < pre_ocr; ++i) {
    if (candidates[i].find(' ') != std::string::npos) continue;
    auto folded = OcrFold(candidates[i]);
    if (folded != candidates[i]) candidates.push_back(std::move(folded));
  }

  std::vector<std::string>        variants;
  std::unordered_set<std::string> seen;
  for (auto& candidate : candidates) {
    if (!seen.insert(candidate).second) continue;
    if (!variants.empty() && (candidate.empty() || IsShortVariant(candidate, original))) continue;
    variants.push_back(std::move(candidate));
  }

  if (variants.size() > max_variants_) variants.resize(max_variants_);
  return variants;
}

} // namespace resolver::normalize
