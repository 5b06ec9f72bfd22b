#ifndef ZKMATRIX_ALGEBRA_FIELDS_PRIME_FIELD_ELEMENT_H_
#define ZKMATRIX_ALGEBRA_FIELDS_PRIME_FIELD_ELEMENT_H_

#include <cstdint>
#include <string>

#include "zkmatrix/algebra/field_element_base.h"
#include "zkmatrix/error_handling/error_handling.h"
#include "zkmatrix/randomness/prng.h"

namespace zkmatrix {

/*
  An element of the prime field of size p = 2^64 - 2^32 + 1.
  The elements fit in one 64 bit word and are kept in standard form (0 <= value < p). The special
  shape of p keeps the field friendly to arithmetic circuits: p - 1 is divisible by 2^32, so the
  field has large power-of-two multiplicative subgroups.
*/
class PrimeFieldElement : public FieldElementBase<PrimeFieldElement> {
 public:
  static constexpr uint64_t kModulus = 0xffffffff00000001;  // 2**64 - 2**32 + 1.

#ifdef NDEBUG
  // The default constructor is allowed to be used only in Release builds in order to reduce memory
  // allocation time for containers of field elements.
  PrimeFieldElement() = default;
#else
  // In debug builds, the default constructor is not allowed to be called at all.
  PrimeFieldElement() = delete;
#endif

  static constexpr PrimeFieldElement Zero() { return PrimeFieldElement(0); }

  static constexpr PrimeFieldElement One() { return PrimeFieldElement(1); }

  static constexpr PrimeFieldElement FromUint(uint64_t val) {
    return PrimeFieldElement(val % kModulus);
  }

  constexpr PrimeFieldElement operator+(const PrimeFieldElement& rhs) const {
    const __uint128_t sum = static_cast<__uint128_t>(value_) + rhs.value_;
    return PrimeFieldElement(static_cast<uint64_t>(sum >= kModulus ? sum - kModulus : sum));
  }

  constexpr PrimeFieldElement operator-(const PrimeFieldElement& rhs) const {
    return PrimeFieldElement(
        value_ >= rhs.value_ ? value_ - rhs.value_ : kModulus - (rhs.value_ - value_));
  }

  constexpr PrimeFieldElement operator-() const { return Zero() - *this; }

  constexpr PrimeFieldElement operator*(const PrimeFieldElement& rhs) const {
    return PrimeFieldElement(
        static_cast<uint64_t>(static_cast<__uint128_t>(value_) * rhs.value_ % kModulus));
  }

  constexpr bool operator==(const PrimeFieldElement& rhs) const { return value_ == rhs.value_; }

  /*
    Returns x^(p-2), which is x^(-1) by Fermat's little theorem. Fails on zero.
  */
  constexpr PrimeFieldElement Inverse() const;

  constexpr uint64_t ToStandardForm() const { return value_; }

  static PrimeFieldElement RandomElement(Prng* prng);

  /*
    Parses a "0x"-prefixed hexadecimal string, as produced by ToString().
  */
  static PrimeFieldElement FromString(const std::string& s);

  std::string ToString() const;

  static constexpr uint64_t FieldSize() { return kModulus; }

 private:
  explicit constexpr PrimeFieldElement(uint64_t val) : value_(val) {}

  uint64_t value_ = 0;
};

}  // namespace zkmatrix

#include "zkmatrix/algebra/fields/prime_field_element.inl"

#endif  // ZKMATRIX_ALGEBRA_FIELDS_PRIME_FIELD_ELEMENT_H_
