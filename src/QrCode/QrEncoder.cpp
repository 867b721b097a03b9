/**
 * @file QrEncoder.cpp
 * @author Grzegorz Kaczmarek SP6HFE
 * @brief
 * @version 0.1
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#include <QrCode/QrEncoder.hpp>
#include <QrCode/RegularSymbol.hpp>
#include <ReedSolomon/Encoder.hpp>

#include <stddef.h>
#include <stdexcept>
#include <string>

namespace qrenc {

QrEncoder::QrEncoder(RecoveryLevel level, bool includeQuietZone) : _level(level), _includeQuietZone(includeQuietZone) {}

void QrEncoder::registerSegmentsCallback(SegmentsCallback callback) {
  _segmentsCallback = std::move(callback);
}

void QrEncoder::registerMaskPenaltyCallback(MaskPenaltyCallback callback) {
  _maskPenaltyCallback = std::move(callback);
}

std::optional<QrCode> QrEncoder::encode(const std::string& content) const {
  return encode(std::vector<uint8_t>(content.cbegin(), content.cend()));
}

std::optional<QrCode> QrEncoder::encode(const std::vector<uint8_t>& content) const {
  std::optional<tools::BitVector> encoded{};
  std::optional<Version> chosenVersion{};

  // 1. Encode data with the narrowest character count fields it fits into
  for (const auto bracket : DataEncoder::ALL_BRACKETS) {
    DataEncoder dataEncoder{bracket};

    encoded = dataEncoder.encode(content);
    if (not encoded.has_value()) {
      continue;
    }

    chosenVersion = Version::choose(_level, dataEncoder.getMinVersion(), dataEncoder.getMaxVersion(), static_cast<uint32_t>(encoded.value().size()));
    if (chosenVersion.has_value()) {
      // notify segments actually encoded
      if (_segmentsCallback) {
        _segmentsCallback({dataEncoder.getOptimisedSegments(), chosenVersion.value()});
      }
      break;
    }
  }

  if ((not encoded.has_value()) or (not chosenVersion.has_value())) {
    return {};
  }

  const auto& version{chosenVersion.value()};
  auto& data{encoded.value()};

  // 2. Fill the data capacity
  addTerminatorBits(version, data);
  addPadding(version, data);

  // 3. Error correction and interleaving
  const auto codewords{encodeBlocks(version, data)};

  // 4. Evaluate all masks
  std::optional<Symbol> bestSymbol{};
  uint8_t bestMask{0U};
  uint32_t bestPenalty{0U};

  for (uint8_t mask{0U}; mask < Version::NUM_MASK_PATTERNS; mask++) {
    auto symbol{RegularSymbol::build(version, mask, codewords, _includeQuietZone)};

    const auto numEmptyModules{symbol.numEmptyModules()};
    if (numEmptyModules != 0U) {
      throw std::logic_error("QrEncoder: " + std::to_string(numEmptyModules) + " modules left empty in version " + std::to_string(version.getNumber()));
    }

    const auto penalty{symbol.penaltyScore()};

    // notify mask penalty
    if (_maskPenaltyCallback) {
      _maskPenaltyCallback({mask, penalty});
    }

    if ((not bestSymbol.has_value()) or (penalty < bestPenalty)) {
      bestSymbol = std::move(symbol);
      bestMask = mask;
      bestPenalty = penalty;
    }
  }

  return QrCode{version, codewords, bestMask, std::move(bestSymbol.value())};
}

void QrEncoder::addTerminatorBits(const Version& version, tools::BitVector& data) {
  data.appendNumBools(version.numTerminatorBitsRequired(static_cast<uint32_t>(data.size())), false);
}

void QrEncoder::addPadding(const Version& version, tools::BitVector& data) {
  const auto numDataBits{version.numDataBits()};
  if (data.size() == numDataBits) {
    return;
  }

  data.appendNumBools(version.numBitsToPadToCodeword(static_cast<uint32_t>(data.size())), false);

  auto firstPadCodeword{true};
  while ((numDataBits - data.size()) >= 8U) {
    data.appendByte(firstPadCodeword ? PAD_CODEWORD_1 : PAD_CODEWORD_2, 8U);
    firstPadCodeword = not firstPadCodeword;
  }

  if (data.size() != numDataBits) {
    throw std::logic_error("QrEncoder: padded data length " + std::to_string(data.size()) + " differs from capacity " + std::to_string(numDataBits));
  }
}

tools::BitVector QrEncoder::encodeBlocks(const Version& version, const tools::BitVector& data) {
  struct DataBlock {
    tools::BitVector codewords;  ///< data codewords followed by error correction codewords
    size_t ecStartOffset;        ///< bit index of the first error correction codeword
  };

  std::vector<DataBlock> blocks{};
  blocks.reserve(version.numBlocks());

  // 1. Split data into blocks and calculate error correction codewords for each one
  size_t end{0U};
  for (const auto& group : version.getBlockGroups()) {
    for (uint8_t blockNo{0U}; blockNo < group.numBlocks; blockNo++) {
      const auto start{end};
      end = start + 8U * group.numDataCodewords;

      const auto numEcCodewords{static_cast<size_t>(group.numCodewords - group.numDataCodewords)};
      blocks.push_back({reedsolomon::Encoder::encode(data.substr(start, end), numEcCodewords), end - start});
    }
  }

  tools::BitVector result{};

  // 2. Data codewords, one from each block in turn (shorter blocks run out first)
  auto working{true};
  for (size_t offset{0U}; working; offset += 8U) {
    working = false;

    for (const auto& block : blocks) {
      if (offset >= block.ecStartOffset) {
        continue;
      }

      result.append(block.codewords.substr(offset, offset + 8U));
      working = true;
    }
  }

  // 3. Error correction codewords, one from each block in turn
  working = true;
  for (size_t offset{0U}; working; offset += 8U) {
    working = false;

    for (const auto& block : blocks) {
      const auto blockOffset{offset + block.ecStartOffset};
      if (blockOffset >= block.codewords.size()) {
        continue;
      }

      result.append(block.codewords.substr(blockOffset, blockOffset + 8U));
      working = true;
    }
  }

  // 4. Remainder bits
  result.appendNumBools(version.getNumRemainderBits(), false);

  return result;
}

std::optional<QrCode> encode(const std::string& content, RecoveryLevel level) {
  const QrEncoder encoder{level};
  return encoder.encode(content);
}

}  // namespace qrenc
