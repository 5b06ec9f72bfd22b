#ifndef ZKMATRIX_ALGEBRA_FIELD_ELEMENT_BASE_H_
#define ZKMATRIX_ALGEBRA_FIELD_ELEMENT_BASE_H_

#include <iostream>
#include <type_traits>

namespace zkmatrix {

/*
  A non-virtual base class for field elements (using CRTP), providing the operators that can be
  derived from the ones every field element defines (+, *, == and Inverse()).

  To define a field element, write:
    class MyFieldElement : public FieldElementBase<MyFieldElement> {
      ...
    };
*/
template <typename Derived>
class FieldElementBase {
 public:
  Derived& operator+=(const Derived& other);
  Derived& operator*=(const Derived& other);
  Derived operator/(const Derived& other) const;
  constexpr bool operator!=(const Derived& other) const;

  constexpr const Derived& AsDerived() const { return static_cast<const Derived&>(*this); }
  constexpr Derived& AsDerived() { return static_cast<Derived&>(*this); }
};

/*
  True if FieldElementT derives from FieldElementBase. For example,
  kIsFieldElement<PrimeFieldElement> == true and kIsFieldElement<int> == false.
*/
template <typename FieldElementT>
constexpr bool kIsFieldElement =
    std::is_base_of<FieldElementBase<FieldElementT>, FieldElementT>::value;

template <typename FieldElementT>
std::enable_if_t<kIsFieldElement<FieldElementT>, std::ostream&> operator<<(
    std::ostream& out, const FieldElementT& element);

}  // namespace zkmatrix

#include "zkmatrix/algebra/field_element_base.inl"

#endif  // ZKMATRIX_ALGEBRA_FIELD_ELEMENT_BASE_H_
