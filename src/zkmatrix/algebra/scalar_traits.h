#ifndef ZKMATRIX_ALGEBRA_SCALAR_TRAITS_H_
#define ZKMATRIX_ALGEBRA_SCALAR_TRAITS_H_

#include <type_traits>
#include <utility>

#include "zkmatrix/algebra/field_element_base.h"

namespace zkmatrix {

/*
  The capabilities a matrix element type must have: binary +, - and * whose results convert back
  to the element type, and a zero value (see ScalarTraits). Nothing else is required; in
  particular the operations need not be commutative or associative.
*/
template <typename T>
using AddResultT = decltype(std::declval<const T&>() + std::declval<const T&>());

template <typename T>
using SubResultT = decltype(std::declval<const T&>() - std::declval<const T&>());

template <typename T>
using MulResultT = decltype(std::declval<const T&>() * std::declval<const T&>());

template <typename T, typename = void>
struct HasScalarOperations : std::false_type {};

template <typename T>
struct HasScalarOperations<T, std::void_t<AddResultT<T>, SubResultT<T>, MulResultT<T>>>
    : std::integral_constant<
          bool, std::is_convertible<AddResultT<T>, T>::value &&
                    std::is_convertible<SubResultT<T>, T>::value &&
                    std::is_convertible<MulResultT<T>, T>::value> {};

template <typename T>
constexpr bool kIsScalar = HasScalarOperations<T>::value;

/*
  TypeIdentityT<T> is T, but a function parameter of this type does not take part in template
  argument deduction. This lets ScalarMult(a, 0) convert 0 to the element type of a.
*/
template <typename T>
struct TypeIdentity {
  using type = T;
};

template <typename T>
using TypeIdentityT = typename TypeIdentity<T>::type;

/*
  Produces the distinguished values of an element type.
  Zero() is the default value every accumulation starts from. One() is the multiplicative
  identity, needed only by Identity() and Pow().

  The primary template value-initializes T, so arithmetic types get 0 and 1. Field elements, which
  may not be default constructed, use their own Zero() and One(). Further specializations (for
  example for square matrices, see matrix.h) may be added next to the element type.
*/
template <typename T, typename = void>
struct ScalarTraits {
  static constexpr T Zero() { return T(); }
  static constexpr T One() { return T(1); }
};

template <typename FieldElementT>
struct ScalarTraits<FieldElementT, std::enable_if_t<kIsFieldElement<FieldElementT>>> {
  static constexpr FieldElementT Zero() { return FieldElementT::Zero(); }
  static constexpr FieldElementT One() { return FieldElementT::One(); }
};

}  // namespace zkmatrix

#endif  // ZKMATRIX_ALGEBRA_SCALAR_TRAITS_H_
