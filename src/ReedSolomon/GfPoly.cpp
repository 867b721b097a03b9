#include <ReedSolomon/GfPoly.hpp>

#include <algorithm>
#include <cstddef>
#include <stdexcept>
#include <utility>

namespace reedsolomon {

GfPoly::GfPoly(std::vector<GfElement> terms) : _terms(std::move(terms)) {
  normalise(_terms);
}

GfPoly GfPoly::monomial(GfElement coefficient, size_t degree) {
  if (coefficient == GaloisField::ZERO) {
    return GfPoly{};
  }

  std::vector<GfElement> terms(degree + 1U, GaloisField::ZERO);
  terms[degree] = coefficient;

  return GfPoly{std::move(terms)};
}

GfPoly GfPoly::fromData(const tools::BitVector& data) {
  const auto numBytes{(data.size() + 7U) / 8U};
  std::vector<GfElement> terms(numBytes, GaloisField::ZERO);

  auto termIndex{numBytes};
  for (size_t bitIndex{0U}; bitIndex < data.size(); bitIndex += 8U) {
    terms[--termIndex] = data.byteAt(bitIndex);
  }

  return GfPoly{std::move(terms)};
}

GfPoly GfPoly::add(const GfPoly& a, const GfPoly& b) {
  const auto& longer{(a.numTerms() >= b.numTerms()) ? a : b};
  const auto& shorter{(a.numTerms() >= b.numTerms()) ? b : a};

  std::vector<GfElement> terms{longer._terms};
  for (size_t degree{0U}; degree < shorter.numTerms(); degree++) {
    terms[degree] = GaloisField::add(terms[degree], shorter._terms[degree]);
  }

  return GfPoly{std::move(terms)};
}

GfPoly GfPoly::multiply(const GfPoly& a, const GfPoly& b) {
  if (a.isZero() or b.isZero()) {
    return GfPoly{};
  }

  std::vector<GfElement> terms(a.numTerms() + b.numTerms(), GaloisField::ZERO);

  for (size_t i{0U}; i < a.numTerms(); i++) {
    for (size_t j{0U}; j < b.numTerms(); j++) {
      terms[i + j] = GaloisField::add(terms[i + j], GaloisField::multiply(a._terms[i], b._terms[j]));
    }
  }

  return GfPoly{std::move(terms)};
}

GfPoly GfPoly::remainder(const GfPoly& numerator, const GfPoly& denominator) {
  if (denominator.isZero()) {
    throw std::domain_error("GfPoly: remainder by zero polynomial");
  }

  std::vector<GfElement> remainderTerms{numerator._terms};
  const auto denominatorTerms{denominator.numTerms()};
  const auto denominatorLeadingTerm{denominator._terms.back()};

  // each pass cancels the leading term so the degree strictly drops
  while (remainderTerms.size() >= denominatorTerms) {
    const auto shift{remainderTerms.size() - denominatorTerms};
    const auto coefficient{GaloisField::divide(remainderTerms.back(), denominatorLeadingTerm)};

    for (size_t degree{0U}; degree < denominatorTerms; degree++) {
      remainderTerms[shift + degree] = GaloisField::add(remainderTerms[shift + degree], GaloisField::multiply(denominator._terms[degree], coefficient));
    }

    normalise(remainderTerms);
  }

  return GfPoly{std::move(remainderTerms)};
}

std::vector<uint8_t> GfPoly::data(size_t numTerms) const {
  if (_terms.size() > numTerms) {
    throw std::length_error("GfPoly: polynomial does not fit requested amount of terms");
  }

  std::vector<uint8_t> result(numTerms, 0U);
  std::reverse_copy(_terms.cbegin(), _terms.cend(), result.begin() + static_cast<std::ptrdiff_t>(numTerms - _terms.size()));

  return result;
}

GfElement GfPoly::term(size_t degree) const {
  return (degree < _terms.size()) ? _terms[degree] : GaloisField::ZERO;
}

std::string GfPoly::toString(bool useIndexForm) const {
  std::string result{};

  for (auto degree{_terms.size()}; degree > 0U; --degree) {
    const auto coefficient{_terms[degree - 1U]};
    if (coefficient == GaloisField::ZERO) {
      continue;
    }

    if (not result.empty()) {
      result += " + ";
    }

    if (useIndexForm) {
      result += "a^" + std::to_string(GaloisField::log(coefficient));
    } else {
      result += std::to_string(coefficient);
    }
    result += "x^" + std::to_string(degree - 1U);
  }

  return result.empty() ? std::string{"0"} : result;
}

void GfPoly::normalise(std::vector<GfElement>& terms) {
  while ((not terms.empty()) and (terms.back() == GaloisField::ZERO)) {
    terms.pop_back();
  }
}

}  // namespace reedsolomon
