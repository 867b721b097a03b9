#pragma once

#include <ReedSolomon/GaloisField.hpp>
#include <Tools/BitVector.hpp>

#include <stddef.h>
#include <stdint.h>
#include <string>
#include <vector>

namespace reedsolomon {

/**
 * @brief Polynomial with GF(2^8) coefficients
 * @note Term i holds the coefficient of x^i. Instances are always normalised
 *       (highest stored term is non-zero, zero polynomial has no terms) and immutable.
 */
class GfPoly {
public:
  /// @brief Zero polynomial
  GfPoly() = default;

  /**
   * @brief Constructor
   *
   * @param terms Coefficients, lowest degree first (trailing zeros are dropped)
   */
  explicit GfPoly(std::vector<GfElement> terms);

  /**
   * @brief Create c*x^degree
   *
   * @param coefficient The coefficient
   * @param degree The degree
   * @return GfPoly The monomial (zero polynomial for zero coefficient)
   */
  static GfPoly monomial(GfElement coefficient, size_t degree);

  /**
   * @brief Interpret data bytes as coefficients
   * @note First byte becomes the highest degree coefficient, last byte the x^0 one.
   *
   * @param data Bits, taken 8 at a time
   * @return GfPoly The polynomial
   */
  static GfPoly fromData(const tools::BitVector& data);

  static GfPoly add(const GfPoly& a, const GfPoly& b);

  static GfPoly multiply(const GfPoly& a, const GfPoly& b);

  /**
   * @brief Remainder of polynomial long division
   * @note Throws std::domain_error for zero denominator.
   *
   * @param numerator The numerator
   * @param denominator The denominator
   * @return GfPoly Remainder with fewer terms than the denominator
   */
  static GfPoly remainder(const GfPoly& numerator, const GfPoly& denominator);

  /**
   * @brief Coefficients as bytes, highest degree first
   * @note Result is left padded with zeros up to numTerms. Throws std::length_error
   *       when the polynomial has more terms than requested.
   *
   * @param numTerms Length of the result
   * @return std::vector<uint8_t> The bytes
   */
  std::vector<uint8_t> data(size_t numTerms) const;

  size_t numTerms() const { return _terms.size(); }

  bool isZero() const { return _terms.empty(); }

  /// @brief Coefficient of x^degree (zero beyond the highest term)
  GfElement term(size_t degree) const;

  const std::vector<GfElement>& terms() const { return _terms; }

  /**
   * @brief Textual representation like "3x^2 + 1x^0"
   *
   * @param useIndexForm Print coefficients as powers of alpha ("a^25x^2")
   */
  std::string toString(bool useIndexForm = false) const;

  bool operator==(const GfPoly& other) const { return _terms == other._terms; }

  bool operator!=(const GfPoly& other) const { return _terms != other._terms; }

private:
  std::vector<GfElement> _terms{};

  static void normalise(std::vector<GfElement>& terms);
};

}  // namespace reedsolomon
