#include "internal/normalize/normalizer.hpp"

#include <cassert>
#include <iostream>
#include <string>

namespace {

using namespace resolver::normalize;

void TestPartNumberDropsSeparatorsAndUppercases() {
  assert(NormalizePartNumber("AGM14NV-412341 4111 ea") == "AGM14NV412341 4111 EA");
  assert(NormalizePartNumber("14nv4123414111") == "14NV4123414111");
  assert(NormalizePartNumber("  br_120 / x.y  ") == "BR120 XY");
  assert(NormalizePartNumber("A@B") == "A B");
  assert(NormalizePartNumber("") == "");
  assert(NormalizePartNumber("---") == "");
}

void TestPartNumberIsIdempotent() {
  for (const std::string raw : {"AGM14NV-412341 4111 ea", "  x  y  ", "PLT2S-C", "a\tb\nc"}) {
    const auto once = NormalizePartNumber(raw);
    assert(NormalizePartNumber(once) == once);
  }
}

void TestManufacturerStripsTrailingSuffixes() {
  assert(NormalizeManufacturer("3M Company") == "3M");
  assert(NormalizeManufacturer("3M") == "3M");
  assert(NormalizeManufacturer("Eaton Corporation") == "EATON");
  assert(NormalizeManufacturer("Acme Holdings Group, Inc.") == "ACME");
  assert(NormalizeManufacturer("Minnesota Mining & Manufacturing Co") == "MINNESOTA MINING AND MANUFACTURING");
  assert(NormalizeManufacturer("L'Oreal S.A.") == "LOREAL");
}

void TestManufacturerNeverStripsLastWord() {
  assert(NormalizeManufacturer("Company") == "COMPANY");
  assert(NormalizeManufacturer("Global Industries") == "GLOBAL");
  assert(NormalizeManufacturer("   ") == "");
}

void TestUnspscRequiresEightDigits() {
  assert(NormalizeUnspsc("31201502") == std::optional<std::string>("31201502"));
  assert(NormalizeUnspsc(" 3120 1502 ") == std::optional<std::string>("31201502"));
  assert(!NormalizeUnspsc("3120150").has_value());
  assert(!NormalizeUnspsc("312015020").has_value());
  assert(!NormalizeUnspsc("3120150A").has_value());
  assert(!NormalizeUnspsc("").has_value());
}

void TestGtinPlaceholdersAreAbsent() {
  assert(NormalizeGtin(" 0005 1131 062309 ") == std::optional<std::string>("00051131062309"));
  assert(!NormalizeGtin("").has_value());
  assert(!NormalizeGtin("0").has_value());
  assert(!NormalizeGtin("nan").has_value());
  assert(!NormalizeGtin("None").has_value());
  assert(!NormalizeGtin("NULL").has_value());
}

void TestTokenizeLowercasesWords() {
  const auto tokens = Tokenize("Scotch Super-33+ Vinyl, 3/4in");
  const std::vector<std::string> expected = {"scotch", "super", "33", "vinyl", "3", "4in"};
  assert(tokens == expected);
  assert(Tokenize("  ").empty());
}

} // namespace

int main() {
  TestPartNumberDropsSeparatorsAndUppercases();
  TestPartNumberIsIdempotent();
  TestManufacturerStripsTrailingSuffixes();
  TestManufacturerNeverStripsLastWord();
  TestUnspscRequiresEightDigits();
  TestGtinPlaceholdersAreAbsent();
  TestTokenizeLowercasesWords();

  std::cout << "normalizer_test: pass\n";
  return 0;
}
