namespace zkmatrix {

constexpr PrimeFieldElement PrimeFieldElement::Inverse() const {
  ASSERT_RELEASE(*this != PrimeFieldElement::Zero(), "Zero does not have an inverse.");
  PrimeFieldElement power = *this;
  PrimeFieldElement res = PrimeFieldElement::One();
  for (uint64_t exp = kModulus - 2; exp != 0; exp >>= 1) {
    if ((exp & 1) == 1) {
      res = res * power;
    }
    power = power * power;
  }
  return res;
}

}  // namespace zkmatrix
