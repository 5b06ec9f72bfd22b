#ifndef ZKMATRIX_ALGEBRA_FIELD_OPERATIONS_H_
#define ZKMATRIX_ALGEBRA_FIELD_OPERATIONS_H_

#include <cstdint>

#include "zkmatrix/randomness/prng.h"

namespace zkmatrix {

/*
  Returns base^exp. Negative exponents are not supported.
*/
template <typename FieldElementT>
FieldElementT Pow(const FieldElementT& base, uint64_t exp) {
  FieldElementT power = base;
  FieldElementT res = FieldElementT::One();
  while (exp != 0) {
    if ((exp & 1) == 1) {
      res *= power;
    }
    power *= power;
    exp >>= 1;
  }
  return res;
}

/*
  Returns a random field element different from zero.
*/
template <typename FieldElementT>
FieldElementT RandomNonZeroElement(Prng* prng) {
  auto x = FieldElementT::RandomElement(prng);
  while (x == FieldElementT::Zero()) {
    x = FieldElementT::RandomElement(prng);
  }
  return x;
}

}  // namespace zkmatrix

#endif  // ZKMATRIX_ALGEBRA_FIELD_OPERATIONS_H_
