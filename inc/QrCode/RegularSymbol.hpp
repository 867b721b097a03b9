#pragma once

#include <QrCode/Symbol.hpp>
#include <QrCode/Version.hpp>
#include <Tools/BitVector.hpp>

#include <stdint.h>
#include <vector>

namespace qrenc {

/// @brief Builder of complete QR Code symbols (function patterns, format/version information and masked data)
class RegularSymbol {
public:
  /// @brief Finder pattern width (and height) in modules
  static constexpr uint16_t FINDER_PATTERN_SIZE{7U};

  /// @brief Alignment pattern width (and height) in modules
  static constexpr uint16_t ALIGNMENT_PATTERN_SIZE{5U};

  /**
   * @brief Build the symbol
   * @note Throws std::invalid_argument for mask pattern outside 0-7 and std::logic_error
   *       when data doesn't fit the symbol.
   *
   * @param version Version and recovery level of the symbol
   * @param maskPattern Data mask pattern (0-7)
   * @param data Interleaved codewords followed by remainder bits
   * @param includeQuietZone Surround the symbol with a 4 module wide light border
   * @return Symbol The symbol
   */
  static Symbol build(const Version& version, uint8_t maskPattern, const tools::BitVector& data, bool includeQuietZone);

  /**
   * @brief Data mask condition at a given module
   * @note Throws std::invalid_argument for mask pattern outside 0-7.
   *
   * @param maskPattern Data mask pattern (0-7)
   * @param x Column
   * @param y Row
   * @return true Module value is to be inverted
   * @return false Module value is to be kept
   */
  static bool maskBit(uint8_t maskPattern, uint32_t x, uint32_t y);

  /**
   * @brief Alignment pattern center coordinates
   *
   * @param versionNumber Version number (1-40)
   * @return const std::vector<uint16_t>& Row/column positions (empty for version 1)
   */
  static const std::vector<uint16_t>& alignmentPatternCenters(uint8_t versionNumber);

private:
  RegularSymbol(const Version& version, uint8_t maskPattern, bool includeQuietZone);

  const Version& _version;

  uint8_t _maskPattern;

  uint16_t _symbolSize;

  Symbol _symbol;

  void addFinderPatterns();

  void addAlignmentPatterns();

  void addTimingPatterns();

  void addFormatInfo();

  void addVersionInfo();

  void addData(const tools::BitVector& data);
};

}  // namespace qrenc
