#pragma once

#include <QrCode/Symbol.hpp>
#include <QrCode/Version.hpp>
#include <Tools/BitVector.hpp>

#include <stdint.h>
#include <vector>

namespace qrenc {

/// @brief Encoded QR Code symbol
class QrCode {
public:
  /**
   * @brief Constructor
   *
   * @param version Chosen version and recovery level
   * @param data Final bit stream (interleaved codewords and remainder bits)
   * @param maskPattern Chosen data mask pattern
   * @param symbol Symbol built with the chosen mask
   */
  QrCode(const Version& version, tools::BitVector data, uint8_t maskPattern, Symbol symbol);

  /// @brief Module rows (quiet zone included when requested), true for dark
  std::vector<std::vector<bool>> bitmap() const;

  /// @brief Side length in modules, quiet zone included
  uint16_t size() const;

  uint8_t getVersionNumber() const { return _version.getNumber(); }

  RecoveryLevel getLevel() const { return _version.getLevel(); }

  uint8_t getMask() const { return _maskPattern; }

  const tools::BitVector& getData() const { return _data; }

  const Symbol& getSymbol() const { return _symbol; }

private:
  Version _version;

  tools::BitVector _data;

  uint8_t _maskPattern;

  Symbol _symbol;
};

}  // namespace qrenc
