#pragma once

#include <stdint.h>

namespace reedsolomon {

/// @brief GF(2^8) element
using GfElement = uint8_t;

/**
 * @brief Arithmetic over GF(2^8) as used by QR Code error correction
 * @note Field is generated by x^8 + x^4 + x^3 + x^2 + 1 with primitive element alpha = 2.
 *       Exp/log tables are computed at compile time and never change.
 */
class GaloisField {
public:
  /// @brief Irreducible polynomial generating the field
  static constexpr uint16_t PRIMITIVE_POLYNOMIAL{0x011D};

  /// @brief Amount of non-zero elements in the field
  static constexpr uint16_t MULTIPLICATIVE_ORDER{255U};

  static constexpr GfElement ZERO{0U};

  static constexpr GfElement ONE{1U};

  /// @brief Field addition (and subtraction) is a bitwise XOR
  static GfElement add(GfElement a, GfElement b) { return static_cast<GfElement>(a ^ b); }

  static GfElement multiply(GfElement a, GfElement b);

  /**
   * @brief Field division
   * @note Throws std::domain_error when divisor is zero.
   *
   * @param a Dividend
   * @param b Divisor
   * @return GfElement a / b
   */
  static GfElement divide(GfElement a, GfElement b);

  /**
   * @brief Multiplicative inverse
   * @note Throws std::domain_error for zero.
   *
   * @param a The element
   * @return GfElement 1 / a
   */
  static GfElement inverse(GfElement a);

  /// @brief alpha^power (power taken modulo 255)
  static GfElement exp(uint16_t power);

  /**
   * @brief Discrete logarithm of the element (alpha^log(a) == a)
   * @note Throws std::domain_error for zero.
   */
  static uint8_t log(GfElement a);
};

}  // namespace reedsolomon
