/**
 * @file BitVector.hpp
 * @author Grzegorz Kaczmarek SP6HFE
 * @brief
 * @version 0.1
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <stddef.h>
#include <stdint.h>
#include <initializer_list>
#include <string>
#include <vector>

namespace tools {

/// @brief Append-only sequence of bits (MSb first within each stored byte)
class BitVector {
public:
  /// @brief Default constructor (empty vector)
  BitVector() = default;

  /**
   * @brief Constructor
   *
   * @param bits Initial bits
   */
  BitVector(std::initializer_list<bool> bits);

  /**
   * @brief Create bit vector from textual representation
   * @note Characters other than '0' and '1' (e.g. spaces used for grouping) are skipped.
   *
   * @param text Text like "0010 0110"
   * @return BitVector The bits
   */
  static BitVector fromBase2String(const std::string& text);

  void appendBit(bool value);

  void appendBools(std::initializer_list<bool> bits);

  /**
   * @brief Append the same value several times
   *
   * @param count Amount of bits to append
   * @param value Value of each bit
   */
  void appendNumBools(size_t count, bool value);

  /**
   * @brief Append numBits least significant bits of the value, MSb first
   *
   * @param value The value
   * @param numBits Amount of bits to append (up to 8)
   */
  void appendByte(uint8_t value, uint8_t numBits);

  /**
   * @brief Append numBits least significant bits of the value, MSb first
   *
   * @param value The value
   * @param numBits Amount of bits to append (up to 32)
   */
  void appendUint32(uint32_t value, uint8_t numBits);

  /// @brief Append full bytes (8 bits each)
  void appendBytes(const std::vector<uint8_t>& bytes);

  void append(const BitVector& other);

  /// @brief Amount of bits stored
  size_t size() const { return _numBits; }

  /**
   * @brief Get bit value
   * @note Throws std::out_of_range for index beyond size().
   *
   * @param index Bit index
   * @return true Bit is set
   * @return false Bit is cleared
   */
  bool at(size_t index) const;

  /**
   * @brief Get up to 8 bits starting at index as a byte (first bit is the most significant one)
   * @note Near the end of the vector less than 8 bits are available - the result holds just those.
   *
   * @param index Index of the first bit
   * @return uint8_t The byte
   */
  uint8_t byteAt(size_t index) const;

  /**
   * @brief Copy a range of bits
   *
   * @param start Index of the first bit
   * @param end Index past the last bit
   * @return BitVector The range [start, end)
   */
  BitVector substr(size_t start, size_t end) const;

  std::vector<bool> bits() const;

  /// @brief Textual representation like "0110"
  std::string toString() const;

  bool operator==(const BitVector& other) const;

  bool operator!=(const BitVector& other) const { return not(*this == other); }

private:
  std::vector<uint8_t> _bytes{};

  size_t _numBits{0U};

  void ensureCapacity(size_t numBits);
};

}  // namespace tools
