#pragma once

#include <ReedSolomon/GfPoly.hpp>
#include <Tools/BitVector.hpp>

#include <stddef.h>

namespace reedsolomon {

/// @brief Systematic Reed-Solomon encoder over GF(2^8) (QR Code flavour: generator roots alpha^0..alpha^(n-1))
class Encoder {
public:
  /// @brief Smallest supported amount of error correction codewords
  static constexpr size_t MIN_EC_CODEWORDS{2U};

  /**
   * @brief Append error correction codewords to the data block
   * @note The data bits are copied verbatim (leading zero bytes are preserved), the remainder
   *       of data(x) * x^n divided by the generator polynomial follows as n bytes.
   *       Throws std::invalid_argument when data is not byte aligned or numEcCodewords < 2.
   *
   * @param data Data block (multiple of 8 bits)
   * @param numEcCodewords Amount of error correction codewords (n)
   * @return tools::BitVector Data followed by error correction codewords
   */
  static tools::BitVector encode(const tools::BitVector& data, size_t numEcCodewords);

  /**
   * @brief Generator polynomial (x + alpha^0)(x + alpha^1)...(x + alpha^(degree-1))
   *
   * @param degree Amount of error correction codewords
   * @return GfPoly The generator
   */
  static GfPoly generatorPolynomial(size_t degree);
};

}  // namespace reedsolomon
