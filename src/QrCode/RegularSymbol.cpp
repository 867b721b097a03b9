#include <QrCode/RegularSymbol.hpp>

#include <stddef.h>
#include <stdexcept>

namespace qrenc {

namespace {

constexpr bool b0{false};
constexpr bool b1{true};

// ISO/IEC 18004 annex E, index is the version number
const std::vector<std::vector<uint16_t>> ALIGNMENT_PATTERN_CENTERS{
    {},
    {},
    {6U, 18U},
    {6U, 22U},
    {6U, 26U},
    {6U, 30U},
    {6U, 34U},
    {6U, 22U, 38U},
    {6U, 24U, 42U},
    {6U, 26U, 46U},
    {6U, 28U, 50U},
    {6U, 30U, 54U},
    {6U, 32U, 58U},
    {6U, 34U, 62U},
    {6U, 26U, 46U, 66U},
    {6U, 26U, 48U, 70U},
    {6U, 26U, 50U, 74U},
    {6U, 30U, 54U, 78U},
    {6U, 30U, 56U, 82U},
    {6U, 30U, 58U, 86U},
    {6U, 34U, 62U, 90U},
    {6U, 28U, 50U, 72U, 94U},
    {6U, 26U, 50U, 74U, 98U},
    {6U, 30U, 54U, 78U, 102U},
    {6U, 28U, 54U, 80U, 106U},
    {6U, 32U, 58U, 84U, 110U},
    {6U, 30U, 58U, 86U, 114U},
    {6U, 34U, 62U, 90U, 118U},
    {6U, 26U, 50U, 74U, 98U, 122U},
    {6U, 30U, 54U, 78U, 102U, 126U},
    {6U, 26U, 52U, 78U, 104U, 130U},
    {6U, 30U, 56U, 82U, 108U, 134U},
    {6U, 34U, 60U, 86U, 112U, 138U},
    {6U, 30U, 58U, 86U, 114U, 142U},
    {6U, 34U, 62U, 90U, 118U, 146U},
    {6U, 30U, 54U, 78U, 102U, 126U, 150U},
    {6U, 24U, 50U, 76U, 102U, 128U, 154U},
    {6U, 28U, 54U, 80U, 106U, 132U, 158U},
    {6U, 32U, 58U, 84U, 110U, 136U, 162U},
    {6U, 26U, 54U, 82U, 110U, 138U, 166U},
    {6U, 30U, 58U, 86U, 114U, 142U, 170U},
};

const std::vector<std::vector<bool>> FINDER_PATTERN{
    {b1, b1, b1, b1, b1, b1, b1},
    {b1, b0, b0, b0, b0, b0, b1},
    {b1, b0, b1, b1, b1, b0, b1},
    {b1, b0, b1, b1, b1, b0, b1},
    {b1, b0, b1, b1, b1, b0, b1},
    {b1, b0, b0, b0, b0, b0, b1},
    {b1, b1, b1, b1, b1, b1, b1},
};

// separators, one module wide and 8 modules long
const std::vector<std::vector<bool>> FINDER_PATTERN_HORIZONTAL_BORDER{
    {b0, b0, b0, b0, b0, b0, b0, b0},
};

const std::vector<std::vector<bool>> FINDER_PATTERN_VERTICAL_BORDER{
    {b0}, {b0}, {b0}, {b0}, {b0}, {b0}, {b0}, {b0},
};

const std::vector<std::vector<bool>> ALIGNMENT_PATTERN{
    {b1, b1, b1, b1, b1},
    {b1, b0, b0, b0, b1},
    {b1, b0, b1, b0, b1},
    {b1, b0, b0, b0, b1},
    {b1, b1, b1, b1, b1},
};

}  // namespace

RegularSymbol::RegularSymbol(const Version& version, uint8_t maskPattern, bool includeQuietZone)
    : _version(version),
      _maskPattern(maskPattern),
      _symbolSize(version.symbolSize()),
      _symbol(version.symbolSize(), includeQuietZone ? Version::QUIET_ZONE_SIZE : 0U) {}

Symbol RegularSymbol::build(const Version& version, uint8_t maskPattern, const tools::BitVector& data, bool includeQuietZone) {
  if (maskPattern >= Version::NUM_MASK_PATTERNS) {
    throw std::invalid_argument("RegularSymbol: mask pattern outside 0-7");
  }

  RegularSymbol builder{version, maskPattern, includeQuietZone};

  // function patterns first so data placement can skip the modules they occupy
  builder.addFinderPatterns();
  builder.addAlignmentPatterns();
  builder.addTimingPatterns();
  builder.addFormatInfo();
  builder.addVersionInfo();
  builder.addData(data);

  return builder._symbol;
}

bool RegularSymbol::maskBit(uint8_t maskPattern, uint32_t x, uint32_t y) {
  switch (maskPattern) {
    case 0U:
      return ((y + x) % 2U) == 0U;
    case 1U:
      return (y % 2U) == 0U;
    case 2U:
      return (x % 3U) == 0U;
    case 3U:
      return ((y + x) % 3U) == 0U;
    case 4U:
      return ((y / 2U + x / 3U) % 2U) == 0U;
    case 5U:
      return ((y * x) % 2U + (y * x) % 3U) == 0U;
    case 6U:
      return (((y * x) % 2U + (y * x) % 3U) % 2U) == 0U;
    case 7U:
      return (((y + x) % 2U + (y * x) % 3U) % 2U) == 0U;
    default:
      throw std::invalid_argument("RegularSymbol: mask pattern outside 0-7");
  }
}

const std::vector<uint16_t>& RegularSymbol::alignmentPatternCenters(uint8_t versionNumber) {
  return ALIGNMENT_PATTERN_CENTERS.at(versionNumber);
}

void RegularSymbol::addFinderPatterns() {
  static constexpr auto fpSize{FINDER_PATTERN_SIZE};

  // top left
  _symbol.set2dPattern(0U, 0U, FINDER_PATTERN);
  _symbol.set2dPattern(0U, fpSize, FINDER_PATTERN_HORIZONTAL_BORDER);
  _symbol.set2dPattern(fpSize, 0U, FINDER_PATTERN_VERTICAL_BORDER);

  // top right
  _symbol.set2dPattern(_symbolSize - fpSize, 0U, FINDER_PATTERN);
  _symbol.set2dPattern(_symbolSize - fpSize - 1U, fpSize, FINDER_PATTERN_HORIZONTAL_BORDER);
  _symbol.set2dPattern(_symbolSize - fpSize - 1U, 0U, FINDER_PATTERN_VERTICAL_BORDER);

  // bottom left
  _symbol.set2dPattern(0U, _symbolSize - fpSize, FINDER_PATTERN);
  _symbol.set2dPattern(0U, _symbolSize - fpSize - 1U, FINDER_PATTERN_HORIZONTAL_BORDER);
  _symbol.set2dPattern(fpSize, _symbolSize - fpSize - 1U, FINDER_PATTERN_VERTICAL_BORDER);
}

void RegularSymbol::addAlignmentPatterns() {
  static constexpr uint16_t halfSize{ALIGNMENT_PATTERN_SIZE / 2U};

  const auto& centers{alignmentPatternCenters(_version.getNumber())};

  for (const auto x : centers) {
    for (const auto y : centers) {
      // positions overlapping finder patterns are left out
      if (not _symbol.isEmpty(x, y)) {
        continue;
      }

      _symbol.set2dPattern(x - halfSize, y - halfSize, ALIGNMENT_PATTERN);
    }
  }
}

void RegularSymbol::addTimingPatterns() {
  auto value{true};

  for (uint16_t i{FINDER_PATTERN_SIZE + 1U}; i < _symbolSize - FINDER_PATTERN_SIZE; i++) {
    _symbol.set(i, FINDER_PATTERN_SIZE - 1U, value);
    _symbol.set(FINDER_PATTERN_SIZE - 1U, i, value);

    value = not value;
  }
}

void RegularSymbol::addFormatInfo() {
  static constexpr auto fpSize{FINDER_PATTERN_SIZE};
  static constexpr size_t lastBit{Version::FORMAT_INFO_LENGTH_BITS - 1U};

  // bit i (counted from LSb) is at index lastBit - i
  const auto formatInfo{_version.formatInfo(_maskPattern)};

  // bits 0-7 under the top right finder pattern
  for (uint16_t i{0U}; i <= 7U; i++) {
    _symbol.set(_symbolSize - i - 1U, fpSize + 1U, formatInfo.at(lastBit - i));
  }

  // bits 0-5 right of the top left finder pattern
  for (uint16_t i{0U}; i <= 5U; i++) {
    _symbol.set(fpSize + 1U, i, formatInfo.at(lastBit - i));
  }

  // bits 6-8 around the corner of the top left finder pattern
  _symbol.set(fpSize + 1U, fpSize, formatInfo.at(lastBit - 6U));
  _symbol.set(fpSize + 1U, fpSize + 1U, formatInfo.at(lastBit - 7U));
  _symbol.set(fpSize, fpSize + 1U, formatInfo.at(lastBit - 8U));

  // bits 9-14 under the top left finder pattern
  for (uint16_t i{9U}; i <= 14U; i++) {
    _symbol.set(14U - i, fpSize + 1U, formatInfo.at(lastBit - i));
  }

  // bits 8-14 right of the bottom left finder pattern
  for (uint16_t i{8U}; i <= 14U; i++) {
    _symbol.set(fpSize + 1U, _symbolSize - fpSize + i - 8U, formatInfo.at(lastBit - i));
  }

  // dark module
  _symbol.set(fpSize + 1U, _symbolSize - fpSize - 1U, true);
}

void RegularSymbol::addVersionInfo() {
  static constexpr size_t lastBit{Version::VERSION_INFO_LENGTH_BITS - 1U};

  const auto versionInfo{_version.versionInfo()};
  if (not versionInfo.has_value()) {
    return;
  }

  const auto& bits{versionInfo.value()};
  for (uint16_t i{0U}; i < bits.size(); i++) {
    const auto value{bits.at(lastBit - i)};

    // above the bottom left finder pattern
    _symbol.set(i / 3U, _symbolSize - FINDER_PATTERN_SIZE - 4U + i % 3U, value);

    // left of the top right finder pattern
    _symbol.set(_symbolSize - FINDER_PATTERN_SIZE - 4U + i % 3U, i / 3U, value);
  }
}

void RegularSymbol::addData(const tools::BitVector& data) {
  // two module wide columns are filled right to left, zig-zagging up and down
  int32_t x{_symbolSize - 2};
  int32_t y{_symbolSize - 1};
  int32_t xOffset{1};
  auto movingUp{true};

  for (size_t bitNo{0U}; bitNo < data.size(); bitNo++) {
    const auto column{static_cast<uint16_t>(x + xOffset)};
    const auto row{static_cast<uint16_t>(y)};

    _symbol.set(column, row, maskBit(_maskPattern, column, row) != data.at(bitNo));

    if (bitNo == data.size() - 1U) {
      break;
    }

    // lookup next free module
    for (;;) {
      if (xOffset == 1) {
        xOffset = 0;
      } else {
        xOffset = 1;

        if (movingUp) {
          if (y > 0) {
            y--;
          } else {
            movingUp = false;
            x -= 2;
          }
        } else {
          if (y < _symbolSize - 1) {
            y++;
          } else {
            movingUp = true;
            x -= 2;
          }
        }
      }

      // vertical timing pattern column is skipped entirely
      if (x == FINDER_PATTERN_SIZE - 2) {
        x--;
      }

      if (x < 0) {
        throw std::logic_error("RegularSymbol: data exceeds symbol capacity");
      }

      if (_symbol.isEmpty(static_cast<uint16_t>(x + xOffset), static_cast<uint16_t>(y))) {
        break;
      }
    }
  }
}

}  // namespace qrenc
