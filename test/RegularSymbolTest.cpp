#include <QrCode/RegularSymbol.hpp>

#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

namespace {

using qrenc::RecoveryLevel;
using qrenc::RegularSymbol;
using qrenc::Symbol;
using qrenc::Version;

Version versionOf(RecoveryLevel level, uint8_t number) {
  const auto version{Version::find(level, number)};
  if (not version.has_value()) {
    throw std::out_of_range("no such version");
  }
  return version.value();
}

// all data codewords zero, so data modules show the mask pattern
tools::BitVector zeroData(const Version& version) {
  uint32_t numBits{version.getNumRemainderBits()};
  for (const auto& group : version.getBlockGroups()) {
    numBits += 8U * static_cast<uint32_t>(group.numBlocks) * group.numCodewords;
  }

  tools::BitVector data{};
  data.appendNumBools(numBits, false);
  return data;
}

void expectFinderPattern(const Symbol& symbol, uint16_t left, uint16_t top) {
  for (uint16_t y{0U}; y < 7U; y++) {
    for (uint16_t x{0U}; x < 7U; x++) {
      const auto onRing{(x == 0U) or (x == 6U) or (y == 0U) or (y == 6U)};
      const auto inCore{(x >= 2U) and (x <= 4U) and (y >= 2U) and (y <= 4U)};
      EXPECT_EQ(symbol.get(left + x, top + y), onRing or inCore) << "at " << left + x << "," << top + y;
    }
  }
}

TEST(RegularSymbolTest, CalculatesMaskConditions) {
  EXPECT_TRUE(RegularSymbol::maskBit(0U, 1U, 1U));
  EXPECT_FALSE(RegularSymbol::maskBit(0U, 1U, 2U));
  EXPECT_TRUE(RegularSymbol::maskBit(1U, 5U, 4U));
  EXPECT_TRUE(RegularSymbol::maskBit(2U, 3U, 1U));
  EXPECT_FALSE(RegularSymbol::maskBit(2U, 4U, 1U));
  EXPECT_TRUE(RegularSymbol::maskBit(3U, 1U, 2U));
  EXPECT_TRUE(RegularSymbol::maskBit(4U, 3U, 2U));
  EXPECT_FALSE(RegularSymbol::maskBit(4U, 0U, 2U));
  EXPECT_TRUE(RegularSymbol::maskBit(5U, 6U, 1U));
  EXPECT_FALSE(RegularSymbol::maskBit(5U, 1U, 1U));
  EXPECT_TRUE(RegularSymbol::maskBit(6U, 3U, 4U));
  EXPECT_FALSE(RegularSymbol::maskBit(6U, 1U, 5U));
  EXPECT_TRUE(RegularSymbol::maskBit(7U, 0U, 0U));
  EXPECT_FALSE(RegularSymbol::maskBit(7U, 1U, 1U));
  EXPECT_THROW(RegularSymbol::maskBit(8U, 0U, 0U), std::invalid_argument);
}

TEST(RegularSymbolTest, ProvidesAlignmentPatternCenters) {
  EXPECT_TRUE(RegularSymbol::alignmentPatternCenters(1U).empty());
  EXPECT_EQ(RegularSymbol::alignmentPatternCenters(2U), (std::vector<uint16_t>{6U, 18U}));
  EXPECT_EQ(RegularSymbol::alignmentPatternCenters(7U), (std::vector<uint16_t>{6U, 22U, 38U}));
  EXPECT_EQ(RegularSymbol::alignmentPatternCenters(40U), (std::vector<uint16_t>{6U, 30U, 58U, 86U, 114U, 142U, 170U}));
  EXPECT_THROW(RegularSymbol::alignmentPatternCenters(41U), std::out_of_range);
}

TEST(RegularSymbolTest, FillsEveryModule) {
  for (const auto number : {1U, 2U, 6U, 7U, 14U, 21U, 40U}) {
    const auto version{versionOf(RecoveryLevel::Medium, static_cast<uint8_t>(number))};

    const auto symbol{RegularSymbol::build(version, 0U, zeroData(version), true)};

    EXPECT_EQ(symbol.numEmptyModules(), 0U) << "version " << number;
    EXPECT_EQ(symbol.getFullSize(), version.symbolSize() + 8U);
  }
}

TEST(RegularSymbolTest, PlacesFunctionPatterns) {
  const auto version{versionOf(RecoveryLevel::Low, 2U)};
  const auto size{version.symbolSize()};

  const auto symbol{RegularSymbol::build(version, 3U, zeroData(version), false)};

  expectFinderPattern(symbol, 0U, 0U);
  expectFinderPattern(symbol, size - 7U, 0U);
  expectFinderPattern(symbol, 0U, size - 7U);

  // separators
  for (uint16_t i{0U}; i < 8U; i++) {
    EXPECT_FALSE(symbol.get(i, 7U));
    EXPECT_FALSE(symbol.get(7U, i));
    EXPECT_FALSE(symbol.get(size - 1U - i, 7U));
    EXPECT_FALSE(symbol.get(size - 8U, i));
    EXPECT_FALSE(symbol.get(i, size - 8U));
  }

  // timing patterns start dark next to the separators
  for (uint16_t i{8U}; i < size - 8U; i++) {
    EXPECT_EQ(symbol.get(i, 6U), (i % 2U) == 0U);
    EXPECT_EQ(symbol.get(6U, i), (i % 2U) == 0U);
  }

  // single alignment pattern centered at (18, 18)
  EXPECT_TRUE(symbol.get(18U, 18U));
  EXPECT_FALSE(symbol.get(17U, 18U));
  EXPECT_FALSE(symbol.get(19U, 17U));
  EXPECT_TRUE(symbol.get(16U, 16U));
  EXPECT_TRUE(symbol.get(20U, 20U));

  // dark module
  EXPECT_TRUE(symbol.get(8U, size - 8U));
}

TEST(RegularSymbolTest, PlacesBothFormatInformationCopies) {
  const auto version{versionOf(RecoveryLevel::High, 1U)};
  const auto size{version.symbolSize()};
  const auto formatInfo{version.formatInfo(5U)};

  const auto symbol{RegularSymbol::build(version, 5U, zeroData(version), false)};

  // bit i counted from the least significant one
  const auto bit{[&formatInfo](uint16_t i) { return formatInfo.at(Version::FORMAT_INFO_LENGTH_BITS - 1U - i); }};

  for (uint16_t i{0U}; i <= 7U; i++) {
    EXPECT_EQ(symbol.get(size - 1U - i, 8U), bit(i)) << "bit " << i;
  }
  for (uint16_t i{0U}; i <= 5U; i++) {
    EXPECT_EQ(symbol.get(8U, i), bit(i)) << "bit " << i;
  }
  EXPECT_EQ(symbol.get(8U, 7U), bit(6U));
  EXPECT_EQ(symbol.get(8U, 8U), bit(7U));
  EXPECT_EQ(symbol.get(7U, 8U), bit(8U));
  for (uint16_t i{9U}; i <= 14U; i++) {
    EXPECT_EQ(symbol.get(14U - i, 8U), bit(i)) << "bit " << i;
  }
  for (uint16_t i{8U}; i <= 14U; i++) {
    EXPECT_EQ(symbol.get(8U, size - 15U + i), bit(i)) << "bit " << i;
  }
}

TEST(RegularSymbolTest, PlacesBothVersionInformationCopies) {
  const auto version{versionOf(RecoveryLevel::Medium, 7U)};
  const auto size{version.symbolSize()};
  const auto versionInfo{version.versionInfo().value()};

  const auto symbol{RegularSymbol::build(version, 0U, zeroData(version), false)};

  for (uint16_t i{0U}; i < Version::VERSION_INFO_LENGTH_BITS; i++) {
    const auto bit{versionInfo.at(Version::VERSION_INFO_LENGTH_BITS - 1U - i)};

    EXPECT_EQ(symbol.get(i / 3U, size - 11U + i % 3U), bit) << "bit " << i;
    EXPECT_EQ(symbol.get(size - 11U + i % 3U, i / 3U), bit) << "bit " << i;
  }
}

TEST(RegularSymbolTest, MasksDataStartingAtBottomRightCorner) {
  const auto version{versionOf(RecoveryLevel::Low, 1U)};

  for (uint8_t mask{0U}; mask < Version::NUM_MASK_PATTERNS; mask++) {
    auto data{zeroData(version)};
    const auto symbol{RegularSymbol::build(version, mask, data, false)};

    // first column pair, bottom up
    EXPECT_EQ(symbol.get(20U, 20U), RegularSymbol::maskBit(mask, 20U, 20U));
    EXPECT_EQ(symbol.get(19U, 20U), RegularSymbol::maskBit(mask, 19U, 20U));
    EXPECT_EQ(symbol.get(20U, 19U), RegularSymbol::maskBit(mask, 20U, 19U));
    EXPECT_EQ(symbol.get(10U, 12U), RegularSymbol::maskBit(mask, 10U, 12U));
  }
}

TEST(RegularSymbolTest, DataBitsInvertMaskedModules) {
  const auto version{versionOf(RecoveryLevel::Low, 1U)};
  tools::BitVector data{true, true, true};
  data.appendNumBools(zeroData(version).size() - 3U, false);

  const auto symbol{RegularSymbol::build(version, 1U, data, false)};

  // mask 1 inverts even rows
  EXPECT_FALSE(symbol.get(20U, 20U));
  EXPECT_FALSE(symbol.get(19U, 20U));
  EXPECT_TRUE(symbol.get(20U, 19U));
  EXPECT_FALSE(symbol.get(19U, 19U));
}

TEST(RegularSymbolTest, RejectsUnknownMaskPattern) {
  const auto version{versionOf(RecoveryLevel::Low, 1U)};

  EXPECT_THROW(RegularSymbol::build(version, 8U, zeroData(version), true), std::invalid_argument);
}

TEST(RegularSymbolTest, RejectsDataExceedingCapacity) {
  const auto version{versionOf(RecoveryLevel::Low, 1U)};
  auto data{zeroData(version)};
  data.appendBit(true);

  EXPECT_THROW(RegularSymbol::build(version, 0U, data, true), std::logic_error);
}

TEST(RegularSymbolTest, LeavesModulesEmptyForShortData) {
  const auto version{versionOf(RecoveryLevel::Low, 1U)};
  tools::BitVector data{};
  data.appendNumBools(100U, false);

  const auto symbol{RegularSymbol::build(version, 0U, data, true)};

  EXPECT_EQ(symbol.numEmptyModules(), 108U);
}

}  // namespace
