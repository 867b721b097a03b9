#pragma once

#include <Tools/BitVector.hpp>

#include <stdint.h>
#include <array>
#include <optional>

namespace qrenc {

/// @brief Error recovery level
enum class RecoveryLevel : uint8_t {
  Low = 0U,  ///< Level L: ~7% of codewords can be restored
  Medium,    ///< Level M: ~15% of codewords can be restored
  High,      ///< Level Q: ~25% of codewords can be restored
  Highest,   ///< Level H: ~30% of codewords can be restored
};

/// @brief Group of equally sized error correction blocks
struct BlockGroup {
  uint8_t numBlocks;         ///< Amount of blocks in the group (0 for an unused group)
  uint8_t numCodewords;      ///< Total codewords per block (data + error correction)
  uint8_t numDataCodewords;  ///< Data codewords per block
};

/// @brief Capacity and block structure of a single QR Code version at a single recovery level
class Version {
public:
  /// @brief Smallest QR Code version
  static constexpr uint8_t MIN_VERSION{1U};

  /// @brief Largest QR Code version
  static constexpr uint8_t MAX_VERSION{40U};

  /// @brief First version carrying Version Information
  static constexpr uint8_t MIN_VERSION_WITH_VERSION_INFO{7U};

  /// @brief Format Information length in bits (5 data bits + 10 BCH bits)
  static constexpr uint8_t FORMAT_INFO_LENGTH_BITS{15U};

  /// @brief Version Information length in bits (6 data bits + 12 BCH bits)
  static constexpr uint8_t VERSION_INFO_LENGTH_BITS{18U};

  /// @brief Quiet zone width in modules on each side of the symbol
  static constexpr uint8_t QUIET_ZONE_SIZE{4U};

  /// @brief Maximum amount of data mask patterns
  static constexpr uint8_t NUM_MASK_PATTERNS{8U};

  /// @brief Amount of (version, level) records
  static constexpr uint16_t NUM_VERSIONS{160U};

  constexpr Version(uint8_t number, RecoveryLevel level, BlockGroup group1, BlockGroup group2, uint8_t numRemainderBits)
      : _number(number), _level(level), _blockGroups{group1, group2}, _numRemainderBits(numRemainderBits) {}

  uint8_t getNumber() const { return _number; }

  RecoveryLevel getLevel() const { return _level; }

  /// @brief Block groups (second group has numBlocks == 0 when unused)
  const std::array<BlockGroup, 2U>& getBlockGroups() const { return _blockGroups; }

  /// @brief Amount of zero bits placed after the interleaved codewords
  uint8_t getNumRemainderBits() const { return _numRemainderBits; }

  /// @brief Data capacity in bits
  uint32_t numDataBits() const;

  /// @brief Total amount of blocks
  uint16_t numBlocks() const;

  /**
   * @brief Terminator length for the given amount of data bits
   *
   * @param numDataBits Length of the encoded data
   * @return uint32_t 4, or less when the symbol is almost full
   */
  uint32_t numTerminatorBitsRequired(uint32_t numDataBits) const;

  /**
   * @brief Amount of zero bits needed to reach the next codeword boundary
   *
   * @param numDataBits Length of the encoded data
   * @return uint32_t 0-7 (0 for data filling the symbol completely)
   */
  uint32_t numBitsToPadToCodeword(uint32_t numDataBits) const;

  /// @brief Symbol side length in modules (without quiet zone)
  uint16_t symbolSize() const;

  /**
   * @brief 15-bit Format Information for this recovery level
   * @note Throws std::invalid_argument for mask pattern outside 0-7.
   *
   * @param maskPattern Data mask pattern identifier
   * @return tools::BitVector The bits, MSb first
   */
  tools::BitVector formatInfo(uint8_t maskPattern) const;

  /**
   * @brief 18-bit Version Information
   *
   * @return std::optional<tools::BitVector> The bits MSb first, empty for versions below 7
   */
  std::optional<tools::BitVector> versionInfo() const;

  /**
   * @brief Lookup the record
   *
   * @param level Recovery level
   * @param number Version number (1-40)
   * @return std::optional<Version> The record, empty for version number out of range
   */
  static std::optional<Version> find(RecoveryLevel level, uint8_t number);

  /**
   * @brief Choose the smallest version able to hold the data
   *
   * @param level Recovery level
   * @param minVersion Smallest version to consider
   * @param maxVersion Largest version to consider
   * @param numDataBits Length of the encoded data
   * @return std::optional<Version> The version, empty when data doesn't fit any version in range
   */
  static std::optional<Version> choose(RecoveryLevel level, uint8_t minVersion, uint8_t maxVersion, uint32_t numDataBits);

private:
  uint8_t _number;

  RecoveryLevel _level;

  std::array<BlockGroup, 2U> _blockGroups;

  uint8_t _numRemainderBits;
};

}  // namespace qrenc
