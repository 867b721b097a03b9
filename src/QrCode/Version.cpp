#include <QrCode/Version.hpp>

#include <algorithm>
#include <stdexcept>

namespace qrenc {

namespace {

constexpr BlockGroup NO_GROUP{0U, 0U, 0U};

// ISO/IEC 18004 table 9 (error correction characteristics) and table 1 (remainder bits)
constexpr std::array<Version, Version::NUM_VERSIONS> VERSIONS{{
    {1U, RecoveryLevel::Low, {1U, 26U, 19U}, NO_GROUP, 0U},
    {1U, RecoveryLevel::Medium, {1U, 26U, 16U}, NO_GROUP, 0U},
    {1U, RecoveryLevel::High, {1U, 26U, 13U}, NO_GROUP, 0U},
    {1U, RecoveryLevel::Highest, {1U, 26U, 9U}, NO_GROUP, 0U},
    {2U, RecoveryLevel::Low, {1U, 44U, 34U}, NO_GROUP, 7U},
    {2U, RecoveryLevel::Medium, {1U, 44U, 28U}, NO_GROUP, 7U},
    {2U, RecoveryLevel::High, {1U, 44U, 22U}, NO_GROUP, 7U},
    {2U, RecoveryLevel::Highest, {1U, 44U, 16U}, NO_GROUP, 7U},
    {3U, RecoveryLevel::Low, {1U, 70U, 55U}, NO_GROUP, 7U},
    {3U, RecoveryLevel::Medium, {1U, 70U, 44U}, NO_GROUP, 7U},
    {3U, RecoveryLevel::High, {2U, 35U, 17U}, NO_GROUP, 7U},
    {3U, RecoveryLevel::Highest, {2U, 35U, 13U}, NO_GROUP, 7U},
    {4U, RecoveryLevel::Low, {1U, 100U, 80U}, NO_GROUP, 7U},
    {4U, RecoveryLevel::Medium, {2U, 50U, 32U}, NO_GROUP, 7U},
    {4U, RecoveryLevel::High, {2U, 50U, 24U}, NO_GROUP, 7U},
    {4U, RecoveryLevel::Highest, {4U, 25U, 9U}, NO_GROUP, 7U},
    {5U, RecoveryLevel::Low, {1U, 134U, 108U}, NO_GROUP, 7U},
    {5U, RecoveryLevel::Medium, {2U, 67U, 43U}, NO_GROUP, 7U},
    {5U, RecoveryLevel::High, {2U, 33U, 15U}, {2U, 34U, 16U}, 7U},
    {5U, RecoveryLevel::Highest, {2U, 33U, 11U}, {2U, 34U, 12U}, 7U},
    {6U, RecoveryLevel::Low, {2U, 86U, 68U}, NO_GROUP, 7U},
    {6U, RecoveryLevel::Medium, {4U, 43U, 27U}, NO_GROUP, 7U},
    {6U, RecoveryLevel::High, {4U, 43U, 19U}, NO_GROUP, 7U},
    {6U, RecoveryLevel::Highest, {4U, 43U, 15U}, NO_GROUP, 7U},
    {7U, RecoveryLevel::Low, {2U, 98U, 78U}, NO_GROUP, 0U},
    {7U, RecoveryLevel::Medium, {4U, 49U, 31U}, NO_GROUP, 0U},
    {7U, RecoveryLevel::High, {2U, 32U, 14U}, {4U, 33U, 15U}, 0U},
    {7U, RecoveryLevel::Highest, {4U, 39U, 13U}, {1U, 40U, 14U}, 0U},
    {8U, RecoveryLevel::Low, {2U, 121U, 97U}, NO_GROUP, 0U},
    {8U, RecoveryLevel::Medium, {2U, 60U, 38U}, {2U, 61U, 39U}, 0U},
    {8U, RecoveryLevel::High, {4U, 40U, 18U}, {2U, 41U, 19U}, 0U},
    {8U, RecoveryLevel::Highest, {4U, 40U, 14U}, {2U, 41U, 15U}, 0U},
    {9U, RecoveryLevel::Low, {2U, 146U, 116U}, NO_GROUP, 0U},
    {9U, RecoveryLevel::Medium, {3U, 58U, 36U}, {2U, 59U, 37U}, 0U},
    {9U, RecoveryLevel::High, {4U, 36U, 16U}, {4U, 37U, 17U}, 0U},
    {9U, RecoveryLevel::Highest, {4U, 36U, 12U}, {4U, 37U, 13U}, 0U},
    {10U, RecoveryLevel::Low, {2U, 86U, 68U}, {2U, 87U, 69U}, 0U},
    {10U, RecoveryLevel::Medium, {4U, 69U, 43U}, {1U, 70U, 44U}, 0U},
    {10U, RecoveryLevel::High, {6U, 43U, 19U}, {2U, 44U, 20U}, 0U},
    {10U, RecoveryLevel::Highest, {6U, 43U, 15U}, {2U, 44U, 16U}, 0U},
    {11U, RecoveryLevel::Low, {4U, 101U, 81U}, NO_GROUP, 0U},
    {11U, RecoveryLevel::Medium, {1U, 80U, 50U}, {4U, 81U, 51U}, 0U},
    {11U, RecoveryLevel::High, {4U, 50U, 22U}, {4U, 51U, 23U}, 0U},
    {11U, RecoveryLevel::Highest, {3U, 36U, 12U}, {8U, 37U, 13U}, 0U},
    {12U, RecoveryLevel::Low, {2U, 116U, 92U}, {2U, 117U, 93U}, 0U},
    {12U, RecoveryLevel::Medium, {6U, 58U, 36U}, {2U, 59U, 37U}, 0U},
    {12U, RecoveryLevel::High, {4U, 46U, 20U}, {6U, 47U, 21U}, 0U},
    {12U, RecoveryLevel::Highest, {7U, 42U, 14U}, {4U, 43U, 15U}, 0U},
    {13U, RecoveryLevel::Low, {4U, 133U, 107U}, NO_GROUP, 0U},
    {13U, RecoveryLevel::Medium, {8U, 59U, 37U}, {1U, 60U, 38U}, 0U},
    {13U, RecoveryLevel::High, {8U, 44U, 20U}, {4U, 45U, 21U}, 0U},
    {13U, RecoveryLevel::Highest, {12U, 33U, 11U}, {4U, 34U, 12U}, 0U},
    {14U, RecoveryLevel::Low, {3U, 145U, 115U}, {1U, 146U, 116U}, 3U},
    {14U, RecoveryLevel::Medium, {4U, 64U, 40U}, {5U, 65U, 41U}, 3U},
    {14U, RecoveryLevel::High, {11U, 36U, 16U}, {5U, 37U, 17U}, 3U},
    {14U, RecoveryLevel::Highest, {11U, 36U, 12U}, {5U, 37U, 13U}, 3U},
    {15U, RecoveryLevel::Low, {5U, 109U, 87U}, {1U, 110U, 88U}, 3U},
    {15U, RecoveryLevel::Medium, {5U, 65U, 41U}, {5U, 66U, 42U}, 3U},
    {15U, RecoveryLevel::High, {5U, 54U, 24U}, {7U, 55U, 25U}, 3U},
    {15U, RecoveryLevel::Highest, {11U, 36U, 12U}, {7U, 37U, 13U}, 3U},
    {16U, RecoveryLevel::Low, {5U, 122U, 98U}, {1U, 123U, 99U}, 3U},
    {16U, RecoveryLevel::Medium, {7U, 73U, 45U}, {3U, 74U, 46U}, 3U},
    {16U, RecoveryLevel::High, {15U, 43U, 19U}, {2U, 44U, 20U}, 3U},
    {16U, RecoveryLevel::Highest, {3U, 45U, 15U}, {13U, 46U, 16U}, 3U},
    {17U, RecoveryLevel::Low, {1U, 135U, 107U}, {5U, 136U, 108U}, 3U},
    {17U, RecoveryLevel::Medium, {10U, 74U, 46U}, {1U, 75U, 47U}, 3U},
    {17U, RecoveryLevel::High, {1U, 50U, 22U}, {15U, 51U, 23U}, 3U},
    {17U, RecoveryLevel::Highest, {2U, 42U, 14U}, {17U, 43U, 15U}, 3U},
    {18U, RecoveryLevel::Low, {5U, 150U, 120U}, {1U, 151U, 121U}, 3U},
    {18U, RecoveryLevel::Medium, {9U, 69U, 43U}, {4U, 70U, 44U}, 3U},
    {18U, RecoveryLevel::High, {17U, 50U, 22U}, {1U, 51U, 23U}, 3U},
    {18U, RecoveryLevel::Highest, {2U, 42U, 14U}, {19U, 43U, 15U}, 3U},
    {19U, RecoveryLevel::Low, {3U, 141U, 113U}, {4U, 142U, 114U}, 3U},
    {19U, RecoveryLevel::Medium, {3U, 70U, 44U}, {11U, 71U, 45U}, 3U},
    {19U, RecoveryLevel::High, {17U, 47U, 21U}, {4U, 48U, 22U}, 3U},
    {19U, RecoveryLevel::Highest, {9U, 39U, 13U}, {16U, 40U, 14U}, 3U},
    {20U, RecoveryLevel::Low, {3U, 135U, 107U}, {5U, 136U, 108U}, 3U},
    {20U, RecoveryLevel::Medium, {3U, 67U, 41U}, {13U, 68U, 42U}, 3U},
    {20U, RecoveryLevel::High, {15U, 54U, 24U}, {5U, 55U, 25U}, 3U},
    {20U, RecoveryLevel::Highest, {15U, 43U, 15U}, {10U, 44U, 16U}, 3U},
    {21U, RecoveryLevel::Low, {4U, 144U, 116U}, {4U, 145U, 117U}, 4U},
    {21U, RecoveryLevel::Medium, {17U, 68U, 42U}, NO_GROUP, 4U},
    {21U, RecoveryLevel::High, {17U, 50U, 22U}, {6U, 51U, 23U}, 4U},
    {21U, RecoveryLevel::Highest, {19U, 46U, 16U}, {6U, 47U, 17U}, 4U},
    {22U, RecoveryLevel::Low, {2U, 139U, 111U}, {7U, 140U, 112U}, 4U},
    {22U, RecoveryLevel::Medium, {17U, 74U, 46U}, NO_GROUP, 4U},
    {22U, RecoveryLevel::High, {7U, 54U, 24U}, {16U, 55U, 25U}, 4U},
    {22U, RecoveryLevel::Highest, {34U, 37U, 13U}, NO_GROUP, 4U},
    {23U, RecoveryLevel::Low, {4U, 151U, 121U}, {5U, 152U, 122U}, 4U},
    {23U, RecoveryLevel::Medium, {4U, 75U, 47U}, {14U, 76U, 48U}, 4U},
    {23U, RecoveryLevel::High, {11U, 54U, 24U}, {14U, 55U, 25U}, 4U},
    {23U, RecoveryLevel::Highest, {16U, 45U, 15U}, {14U, 46U, 16U}, 4U},
    {24U, RecoveryLevel::Low, {6U, 147U, 117U}, {4U, 148U, 118U}, 4U},
    {24U, RecoveryLevel::Medium, {6U, 73U, 45U}, {14U, 74U, 46U}, 4U},
    {24U, RecoveryLevel::High, {11U, 54U, 24U}, {16U, 55U, 25U}, 4U},
    {24U, RecoveryLevel::Highest, {30U, 46U, 16U}, {2U, 47U, 17U}, 4U},
    {25U, RecoveryLevel::Low, {8U, 132U, 106U}, {4U, 133U, 107U}, 4U},
    {25U, RecoveryLevel::Medium, {8U, 75U, 47U}, {13U, 76U, 48U}, 4U},
    {25U, RecoveryLevel::High, {7U, 54U, 24U}, {22U, 55U, 25U}, 4U},
    {25U, RecoveryLevel::Highest, {22U, 45U, 15U}, {13U, 46U, 16U}, 4U},
    {26U, RecoveryLevel::Low, {10U, 142U, 114U}, {2U, 143U, 115U}, 4U},
    {26U, RecoveryLevel::Medium, {19U, 74U, 46U}, {4U, 75U, 47U}, 4U},
    {26U, RecoveryLevel::High, {28U, 50U, 22U}, {6U, 51U, 23U}, 4U},
    {26U, RecoveryLevel::Highest, {33U, 46U, 16U}, {4U, 47U, 17U}, 4U},
    {27U, RecoveryLevel::Low, {8U, 152U, 122U}, {4U, 153U, 123U}, 4U},
    {27U, RecoveryLevel::Medium, {22U, 73U, 45U}, {3U, 74U, 46U}, 4U},
    {27U, RecoveryLevel::High, {8U, 53U, 23U}, {26U, 54U, 24U}, 4U},
    {27U, RecoveryLevel::Highest, {12U, 45U, 15U}, {28U, 46U, 16U}, 4U},
    {28U, RecoveryLevel::Low, {3U, 147U, 117U}, {10U, 148U, 118U}, 3U},
    {28U, RecoveryLevel::Medium, {3U, 73U, 45U}, {23U, 74U, 46U}, 3U},
    {28U, RecoveryLevel::High, {4U, 54U, 24U}, {31U, 55U, 25U}, 3U},
    {28U, RecoveryLevel::Highest, {11U, 45U, 15U}, {31U, 46U, 16U}, 3U},
    {29U, RecoveryLevel::Low, {7U, 146U, 116U}, {7U, 147U, 117U}, 3U},
    {29U, RecoveryLevel::Medium, {21U, 73U, 45U}, {7U, 74U, 46U}, 3U},
    {29U, RecoveryLevel::High, {1U, 53U, 23U}, {37U, 54U, 24U}, 3U},
    {29U, RecoveryLevel::Highest, {19U, 45U, 15U}, {26U, 46U, 16U}, 3U},
    {30U, RecoveryLevel::Low, {5U, 145U, 115U}, {10U, 146U, 116U}, 3U},
    {30U, RecoveryLevel::Medium, {19U, 75U, 47U}, {10U, 76U, 48U}, 3U},
    {30U, RecoveryLevel::High, {15U, 54U, 24U}, {25U, 55U, 25U}, 3U},
    {30U, RecoveryLevel::Highest, {23U, 45U, 15U}, {25U, 46U, 16U}, 3U},
    {31U, RecoveryLevel::Low, {13U, 145U, 115U}, {3U, 146U, 116U}, 3U},
    {31U, RecoveryLevel::Medium, {2U, 74U, 46U}, {29U, 75U, 47U}, 3U},
    {31U, RecoveryLevel::High, {42U, 54U, 24U}, {1U, 55U, 25U}, 3U},
    {31U, RecoveryLevel::Highest, {23U, 45U, 15U}, {28U, 46U, 16U}, 3U},
    {32U, RecoveryLevel::Low, {17U, 145U, 115U}, NO_GROUP, 3U},
    {32U, RecoveryLevel::Medium, {10U, 74U, 46U}, {23U, 75U, 47U}, 3U},
    {32U, RecoveryLevel::High, {10U, 54U, 24U}, {35U, 55U, 25U}, 3U},
    {32U, RecoveryLevel::Highest, {19U, 45U, 15U}, {35U, 46U, 16U}, 3U},
    {33U, RecoveryLevel::Low, {17U, 145U, 115U}, {1U, 146U, 116U}, 3U},
    {33U, RecoveryLevel::Medium, {14U, 74U, 46U}, {21U, 75U, 47U}, 3U},
    {33U, RecoveryLevel::High, {29U, 54U, 24U}, {19U, 55U, 25U}, 3U},
    {33U, RecoveryLevel::Highest, {11U, 45U, 15U}, {46U, 46U, 16U}, 3U},
    {34U, RecoveryLevel::Low, {13U, 145U, 115U}, {6U, 146U, 116U}, 3U},
    {34U, RecoveryLevel::Medium, {14U, 74U, 46U}, {23U, 75U, 47U}, 3U},
    {34U, RecoveryLevel::High, {44U, 54U, 24U}, {7U, 55U, 25U}, 3U},
    {34U, RecoveryLevel::Highest, {59U, 46U, 16U}, {1U, 47U, 17U}, 3U},
    {35U, RecoveryLevel::Low, {12U, 151U, 121U}, {7U, 152U, 122U}, 0U},
    {35U, RecoveryLevel::Medium, {12U, 75U, 47U}, {26U, 76U, 48U}, 0U},
    {35U, RecoveryLevel::High, {39U, 54U, 24U}, {14U, 55U, 25U}, 0U},
    {35U, RecoveryLevel::Highest, {22U, 45U, 15U}, {41U, 46U, 16U}, 0U},
    {36U, RecoveryLevel::Low, {6U, 151U, 121U}, {14U, 152U, 122U}, 0U},
    {36U, RecoveryLevel::Medium, {6U, 75U, 47U}, {34U, 76U, 48U}, 0U},
    {36U, RecoveryLevel::High, {46U, 54U, 24U}, {10U, 55U, 25U}, 0U},
    {36U, RecoveryLevel::Highest, {2U, 45U, 15U}, {64U, 46U, 16U}, 0U},
    {37U, RecoveryLevel::Low, {17U, 152U, 122U}, {4U, 153U, 123U}, 0U},
    {37U, RecoveryLevel::Medium, {29U, 74U, 46U}, {14U, 75U, 47U}, 0U},
    {37U, RecoveryLevel::High, {49U, 54U, 24U}, {10U, 55U, 25U}, 0U},
    {37U, RecoveryLevel::Highest, {24U, 45U, 15U}, {46U, 46U, 16U}, 0U},
    {38U, RecoveryLevel::Low, {4U, 152U, 122U}, {18U, 153U, 123U}, 0U},
    {38U, RecoveryLevel::Medium, {13U, 74U, 46U}, {32U, 75U, 47U}, 0U},
    {38U, RecoveryLevel::High, {48U, 54U, 24U}, {14U, 55U, 25U}, 0U},
    {38U, RecoveryLevel::Highest, {42U, 45U, 15U}, {32U, 46U, 16U}, 0U},
    {39U, RecoveryLevel::Low, {20U, 147U, 117U}, {4U, 148U, 118U}, 0U},
    {39U, RecoveryLevel::Medium, {40U, 75U, 47U}, {7U, 76U, 48U}, 0U},
    {39U, RecoveryLevel::High, {43U, 54U, 24U}, {22U, 55U, 25U}, 0U},
    {39U, RecoveryLevel::Highest, {10U, 45U, 15U}, {67U, 46U, 16U}, 0U},
    {40U, RecoveryLevel::Low, {19U, 148U, 118U}, {6U, 149U, 119U}, 0U},
    {40U, RecoveryLevel::Medium, {18U, 75U, 47U}, {31U, 76U, 48U}, 0U},
    {40U, RecoveryLevel::High, {34U, 54U, 24U}, {34U, 55U, 25U}, 0U},
    {40U, RecoveryLevel::Highest, {20U, 45U, 15U}, {61U, 46U, 16U}, 0U},
}};

// Format Information (BCH(15,5) encoded and XOR masked with 0x5412), indexed by (level id | mask pattern)
constexpr std::array<uint16_t, 32U> FORMAT_INFO{{
    0x5412, 0x5125, 0x5E7C, 0x5B4B, 0x45F9, 0x40CE, 0x4F97, 0x4AA0,
    0x77C4, 0x72F3, 0x7DAA, 0x789D, 0x662F, 0x6318, 0x6C41, 0x6976,
    0x1689, 0x13BE, 0x1CE7, 0x19D0, 0x0762, 0x0255, 0x0D0C, 0x083B,
    0x355F, 0x3068, 0x3F31, 0x3A06, 0x24B4, 0x2183, 0x2EDA, 0x2BED,
}};

// Version Information (BCH(18,6) encoded) for versions 7-40
constexpr std::array<uint32_t, Version::MAX_VERSION - Version::MIN_VERSION_WITH_VERSION_INFO + 1U> VERSION_INFO{{
    0x07C94, 0x085BC, 0x09A99, 0x0A4D3, 0x0BBF6, 0x0C762,
    0x0D847, 0x0E60D, 0x0F928, 0x10B78, 0x1145D, 0x12A17,
    0x13532, 0x149A6, 0x15683, 0x168C9, 0x177EC, 0x18EC4,
    0x191E1, 0x1AFAB, 0x1B08E, 0x1CC1A, 0x1D33F, 0x1ED75,
    0x1F250, 0x209D5, 0x216F0, 0x228BA, 0x2379F, 0x24B0B,
    0x2542E, 0x26A64, 0x27541, 0x28C69,
}};

// Format Information recovery level identifiers
uint8_t levelIdentifier(RecoveryLevel level) {
  switch (level) {
    case RecoveryLevel::Low:
      return 0x08;
    case RecoveryLevel::Medium:
      return 0x00;
    case RecoveryLevel::High:
      return 0x18;
    case RecoveryLevel::Highest:
      return 0x10;
    default:
      throw std::invalid_argument("Version: unknown recovery level");
  }
}

}  // namespace

uint32_t Version::numDataBits() const {
  uint32_t numDataBits{0U};
  for (const auto& group : _blockGroups) {
    numDataBits += 8U * static_cast<uint32_t>(group.numBlocks) * static_cast<uint32_t>(group.numDataCodewords);
  }

  return numDataBits;
}

uint16_t Version::numBlocks() const {
  uint16_t numBlocks{0U};
  for (const auto& group : _blockGroups) {
    numBlocks += group.numBlocks;
  }

  return numBlocks;
}

uint32_t Version::numTerminatorBitsRequired(uint32_t numDataBits) const {
  static constexpr uint32_t TERMINATOR_LENGTH{4U};

  const auto capacity{this->numDataBits()};
  if (numDataBits >= capacity) {
    return 0U;
  }

  return std::min(TERMINATOR_LENGTH, capacity - numDataBits);
}

uint32_t Version::numBitsToPadToCodeword(uint32_t numDataBits) const {
  if (numDataBits == this->numDataBits()) {
    return 0U;
  }

  return (8U - numDataBits % 8U) % 8U;
}

uint16_t Version::symbolSize() const {
  return static_cast<uint16_t>(21U + 4U * (_number - 1U));
}

tools::BitVector Version::formatInfo(uint8_t maskPattern) const {
  if (maskPattern >= NUM_MASK_PATTERNS) {
    throw std::invalid_argument("Version: mask pattern outside 0-7");
  }

  tools::BitVector result{};
  result.appendUint32(FORMAT_INFO.at(levelIdentifier(_level) | maskPattern), FORMAT_INFO_LENGTH_BITS);

  return result;
}

std::optional<tools::BitVector> Version::versionInfo() const {
  if (_number < MIN_VERSION_WITH_VERSION_INFO) {
    return {};
  }

  tools::BitVector result{};
  result.appendUint32(VERSION_INFO.at(_number - MIN_VERSION_WITH_VERSION_INFO), VERSION_INFO_LENGTH_BITS);

  return result;
}

std::optional<Version> Version::find(RecoveryLevel level, uint8_t number) {
  for (const auto& version : VERSIONS) {
    if ((version._number == number) and (version._level == level)) {
      return version;
    }
  }

  return {};
}

std::optional<Version> Version::choose(RecoveryLevel level, uint8_t minVersion, uint8_t maxVersion, uint32_t numDataBits) {
  for (const auto& version : VERSIONS) {
    if ((version._level != level) or (version._number < minVersion)) {
      continue;
    }

    if (version._number > maxVersion) {
      break;
    }

    if (numDataBits <= version.numDataBits()) {
      return version;
    }
  }

  return {};
}

}  // namespace qrenc
