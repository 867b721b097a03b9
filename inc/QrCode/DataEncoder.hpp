#pragma once

#include <Tools/BitVector.hpp>

#include <stddef.h>
#include <stdint.h>
#include <array>
#include <optional>
#include <vector>

namespace qrenc {

/// @brief QR Code data mode (ordered from the most to the least compact one)
enum class DataMode : uint8_t {
  None = 0U,     ///< No data classified yet
  Numeric,       ///< Digits 0-9
  Alphanumeric,  ///< Digits, upper case letters and " $%*+-./:"
  Byte,          ///< Any 8-bit value
};

/// @brief Run of input bytes encoded with a single data mode
struct Segment {
  DataMode mode;              ///< Data mode of the run
  std::vector<uint8_t> data;  ///< Input bytes of the run

  bool operator==(const Segment& other) const { return (mode == other.mode) and (data == other.data); }
};

/// @brief Range of QR Code versions sharing the same character count field widths
enum class VersionBracket : uint8_t {
  Versions1To9 = 0U,  ///< Versions 1-9
  Versions10To26,     ///< Versions 10-26
  Versions27To40,     ///< Versions 27-40
};

/// @brief Data encoder for a single version bracket
class DataEncoder {
public:
  /// @brief All brackets, from the smallest symbols to the largest ones
  static constexpr std::array<VersionBracket, 3U> ALL_BRACKETS{VersionBracket::Versions1To9, VersionBracket::Versions10To26, VersionBracket::Versions27To40};

  /// @brief Mode indicator length in bits
  static constexpr uint8_t MODE_INDICATOR_BITS{4U};

  /// @brief Mode indicators
  static constexpr uint8_t NUMERIC_MODE_INDICATOR{0x01};
  static constexpr uint8_t ALPHANUMERIC_MODE_INDICATOR{0x02};
  static constexpr uint8_t BYTE_MODE_INDICATOR{0x04};

  /// @brief Amount of symbols in alphanumeric mode alphabet
  static constexpr uint8_t ALPHANUMERIC_CHARSET_SIZE{45U};

  /**
   * @brief Constructor
   *
   * @param bracket Version bracket the encoder produces data for
   */
  explicit DataEncoder(VersionBracket bracket);

  /// @brief Default destructor
  ~DataEncoder() = default;

  /**
   * @brief Classify, optimise and encode the data
   * @note Segments of the last run are kept and may be retrieved with getActualSegments()
   *       and getOptimisedSegments().
   *
   * @param data Content to encode
   * @return std::optional<tools::BitVector> Encoded segments (no terminator or padding),
   *         empty for no data or when a segment can't be described in this bracket
   */
  std::optional<tools::BitVector> encode(const std::vector<uint8_t>& data);

  /**
   * @brief Length of a segment in bits, including mode indicator and character count
   *
   * @param mode The data mode
   * @param numChars Amount of characters (bytes) in the segment
   * @return std::optional<uint32_t> Length, empty when numChars exceeds the character count field
   */
  std::optional<uint32_t> encodedLength(DataMode mode, size_t numChars) const;

  /**
   * @brief Encode data in a given mode (mode indicator, character count, payload)
   *
   * @param data Characters to encode (must be valid for the mode)
   * @param mode The data mode
   * @param encoded Destination
   */
  void encodeDataRaw(const std::vector<uint8_t>& data, DataMode mode, tools::BitVector& encoded) const;

  VersionBracket getBracket() const { return _bracket; }

  uint8_t getMinVersion() const;

  uint8_t getMaxVersion() const;

  /// @brief Character count field width for the mode in this bracket
  uint8_t charCountBits(DataMode mode) const;

  /// @brief Segments found by data classification
  const std::vector<Segment>& getActualSegments() const { return _actual; }

  /// @brief Segments actually encoded
  const std::vector<Segment>& getOptimisedSegments() const { return _optimised; }

  /// @brief Data mode required for a single byte
  static DataMode classify(uint8_t value);

  /**
   * @brief Alphanumeric mode value of a character
   * @note Throws std::invalid_argument for a character outside the alphabet.
   */
  static uint8_t alphanumericValue(uint8_t character);

private:
  VersionBracket _bracket;

  std::vector<Segment> _actual{};

  std::vector<Segment> _optimised{};

  DataMode classifyDataModes(const std::vector<uint8_t>& data);

  bool optimiseDataModes();
};

}  // namespace qrenc
