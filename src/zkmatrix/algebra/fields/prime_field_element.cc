#include "zkmatrix/algebra/fields/prime_field_element.h"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace zkmatrix {

PrimeFieldElement PrimeFieldElement::RandomElement(Prng* prng) {
  return PrimeFieldElement(prng->UniformInt<uint64_t>(0, kModulus - 1));
}

PrimeFieldElement PrimeFieldElement::FromString(const std::string& s) {
  ASSERT_RELEASE(
      s.size() > 2 && s[0] == '0' && s[1] == 'x',
      "String (\"" + s + "\") does not start with '0x' followed by digits.");
  std::string digits = s.substr(2);
  ASSERT_RELEASE(
      std::all_of(digits.begin(), digits.end(), [](unsigned char c) { return std::isxdigit(c); }),
      "String (\"" + s + "\") is not a hexadecimal number.");
  // Trim leading zeros, keeping at least one digit.
  digits.erase(0, std::min(digits.find_first_not_of('0'), digits.size() - 1));
  ASSERT_RELEASE(
      digits.size() <= 16, "String (\"" + s + "\") does not fit in a 64 bit word.");
  const uint64_t value = std::stoull(digits, nullptr, 16);
  ASSERT_RELEASE(
      value < kModulus, "String (\"" + s + "\") is not smaller than the field size.");
  return PrimeFieldElement(value);
}

std::string PrimeFieldElement::ToString() const {
  std::stringstream s;
  s << "0x" << std::hex << value_;
  return s.str();
}

}  // namespace zkmatrix
