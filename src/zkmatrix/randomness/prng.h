#ifndef ZKMATRIX_RANDOMNESS_PRNG_H_
#define ZKMATRIX_RANDOMNESS_PRNG_H_

#include <cstddef>
#include <cstdint>
#include <random>
#include <type_traits>
#include <vector>

#include "zkmatrix/error_handling/error_handling.h"

namespace zkmatrix {

/*
  Pseudo Random Number Generator class.
  Used to draw random matrices and field elements in tests and benchmarks. Not suitable for
  cryptographic randomness.

  Note: This class is not thread safe.
*/
class Prng {
 public:
  /*
    Seeds from the --random_seed flag if it is set, and from the system time otherwise. The seed
    is logged so a run can be replayed.
  */
  Prng();
  ~Prng() = default;

  explicit Prng(uint64_t seed) : seed_(seed), engine_(seed) {}

  Prng& operator=(const Prng&) = delete;
  Prng(Prng&& src) = default;
  Prng& operator=(Prng&& other) = default;

  Prng Clone() const { return Prng(*this); }

  uint64_t Seed() const { return seed_; }

  /*
    Returns a random integer in the closed interval [min, max].
  */
  template <typename T>
  T UniformInt(T min, T max) {
    static_assert(std::is_integral<T>::value, "Type is not integral.");
    ASSERT_RELEASE(min <= max, "Invalid interval.");
    std::uniform_int_distribution<T> d(min, max);
    return d(engine_);
  }

  /*
    Returns a vector of n_elements random integers in the closed interval [min, max].
  */
  template <typename T>
  std::vector<T> UniformIntVector(T min, T max, size_t n_elements) {
    static_assert(std::is_integral<T>::value, "Type is not integral.");
    ASSERT_RELEASE(min <= max, "Invalid interval.");
    std::uniform_int_distribution<T> d(min, max);
    std::vector<T> return_vec;
    return_vec.reserve(n_elements);
    for (size_t i = 0; i < n_elements; ++i) {
      return_vec.push_back(d(engine_));
    }
    return return_vec;
  }

  template <typename FieldElementT>
  std::vector<FieldElementT> RandomFieldElementVector(size_t n_elements) {
    std::vector<FieldElementT> return_vec;
    return_vec.reserve(n_elements);
    for (size_t i = 0; i < n_elements; ++i) {
      return_vec.push_back(FieldElementT::RandomElement(this));
    }
    return return_vec;
  }

 private:
  // Private copy constructor to prevent copy by mistake, resulting in correlated randomness.
  Prng(const Prng&) = default;

  uint64_t seed_;
  std::mt19937_64 engine_;
};

}  // namespace zkmatrix

#endif  // ZKMATRIX_RANDOMNESS_PRNG_H_
