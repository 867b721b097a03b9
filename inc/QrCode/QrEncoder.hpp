/**
 * @file QrEncoder.hpp
 * @author Grzegorz Kaczmarek SP6HFE
 * @brief
 * @version 0.1
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <QrCode/DataEncoder.hpp>
#include <QrCode/QrCode.hpp>
#include <QrCode/Version.hpp>
#include <Tools/BitVector.hpp>

#include <functional>
#include <stdint.h>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace qrenc {

/// @brief QR Code encoder
class QrEncoder {
public:
  /// @brief Pad codewords appended alternately after the terminator
  static constexpr uint8_t PAD_CODEWORD_1{0xEC};
  static constexpr uint8_t PAD_CODEWORD_2{0x11};

  /// @brief Encoded segments callback (optimised segments, chosen version)
  using SegmentsCallback = std::function<void(std::pair<const std::vector<Segment>&, const Version&>)>;

  /// @brief Mask evaluation callback (mask pattern, penalty score)
  using MaskPenaltyCallback = std::function<void(std::pair<uint8_t, uint32_t>)>;

  /**
   * @brief Constructor
   *
   * @param level Error recovery level
   * @param includeQuietZone Surround produced symbols with a 4 module wide light border
   */
  explicit QrEncoder(RecoveryLevel level, bool includeQuietZone = true);

  /// @brief Default destructor
  ~QrEncoder() = default;

  /**
   * @brief Register encoded segments callback
   *
   * @param callback The callback
   */
  void registerSegmentsCallback(SegmentsCallback callback);

  /**
   * @brief Register mask evaluation callback
   *
   * @param callback The callback
   */
  void registerMaskPenaltyCallback(MaskPenaltyCallback callback);

  /**
   * @brief Encode the content
   * @note The smallest version able to hold the content is used. All 8 masks are evaluated and the one
   *       with the lowest penalty score wins (lower mask pattern on ties).
   *
   * @param content Bytes to encode
   * @return std::optional<QrCode> The symbol, empty for no content or content too long for the recovery level
   */
  std::optional<QrCode> encode(const std::vector<uint8_t>& content) const;

  /// @copydoc encode(const std::vector<uint8_t>&) const
  std::optional<QrCode> encode(const std::string& content) const;

  RecoveryLevel getLevel() const { return _level; }

private:
  RecoveryLevel _level;

  bool _includeQuietZone;

  SegmentsCallback _segmentsCallback{nullptr};

  MaskPenaltyCallback _maskPenaltyCallback{nullptr};

  static void addTerminatorBits(const Version& version, tools::BitVector& data);

  static void addPadding(const Version& version, tools::BitVector& data);

  static tools::BitVector encodeBlocks(const Version& version, const tools::BitVector& data);
};

/**
 * @brief Encode the content with default settings (quiet zone included)
 *
 * @param content Text to encode (bytes taken as is)
 * @param level Error recovery level
 * @return std::optional<QrCode> The symbol, empty for no content or content too long for the recovery level
 */
std::optional<QrCode> encode(const std::string& content, RecoveryLevel level);

}  // namespace qrenc
