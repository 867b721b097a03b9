#include <QrCode/Symbol.hpp>

#include <stddef.h>
#include <stdexcept>

namespace qrenc {

Symbol::Symbol(uint16_t symbolSize, uint16_t quietZoneSize)
    : _symbolSize(symbolSize),
      _quietZoneSize(quietZoneSize),
      _fullSize(static_cast<uint16_t>(symbolSize + 2U * quietZoneSize)),
      _modules(static_cast<size_t>(_fullSize) * _fullSize, false),
      _used(static_cast<size_t>(_fullSize) * _fullSize, false) {}

bool Symbol::get(uint16_t x, uint16_t y) const {
  return _modules[indexOf(x, y)];
}

bool Symbol::isEmpty(uint16_t x, uint16_t y) const {
  return not _used[indexOf(x, y)];
}

void Symbol::set(uint16_t x, uint16_t y, bool value) {
  const auto index{indexOf(x, y)};
  _modules[index] = value;
  _used[index] = true;
}

void Symbol::set2dPattern(uint16_t x, uint16_t y, const std::vector<std::vector<bool>>& pattern) {
  for (size_t rowNo{0U}; rowNo < pattern.size(); rowNo++) {
    for (size_t columnNo{0U}; columnNo < pattern[rowNo].size(); columnNo++) {
      set(static_cast<uint16_t>(x + columnNo), static_cast<uint16_t>(y + rowNo), pattern[rowNo][columnNo]);
    }
  }
}

uint32_t Symbol::numEmptyModules() const {
  uint32_t count{0U};
  for (uint16_t y{0U}; y < _symbolSize; y++) {
    for (uint16_t x{0U}; x < _symbolSize; x++) {
      if (isEmpty(x, y)) {
        count++;
      }
    }
  }

  return count;
}

std::vector<std::vector<bool>> Symbol::bitmap() const {
  std::vector<std::vector<bool>> result(_fullSize, std::vector<bool>(_fullSize, false));

  for (size_t rowNo{0U}; rowNo < _fullSize; rowNo++) {
    for (size_t columnNo{0U}; columnNo < _fullSize; columnNo++) {
      result[rowNo][columnNo] = _modules[rowNo * _fullSize + columnNo];
    }
  }

  return result;
}

uint32_t Symbol::penaltyScore() const {
  return penalty1() + penalty2() + penalty3() + penalty4();
}

uint32_t Symbol::penalty1() const {
  uint32_t penalty{0U};

  // pass 0 walks columns, pass 1 walks rows
  for (uint8_t pass{0U}; pass < 2U; pass++) {
    for (uint16_t lineNo{0U}; lineNo < _symbolSize; lineNo++) {
      auto lastValue{(pass == 0U) ? get(lineNo, 0U) : get(0U, lineNo)};
      uint32_t count{1U};

      for (uint16_t moduleNo{1U}; moduleNo < _symbolSize; moduleNo++) {
        const auto value{(pass == 0U) ? get(lineNo, moduleNo) : get(moduleNo, lineNo)};

        if (value != lastValue) {
          count = 1U;
          lastValue = value;
        } else {
          count++;
          if (count == 6U) {
            penalty += PENALTY_WEIGHT_1 + 1U;
          } else if (count > 6U) {
            penalty++;
          }
        }
      }
    }
  }

  return penalty;
}

uint32_t Symbol::penalty2() const {
  uint32_t penalty{0U};

  for (uint16_t y{1U}; y < _symbolSize; y++) {
    for (uint16_t x{1U}; x < _symbolSize; x++) {
      const auto current{get(x, y)};

      if ((current == get(x - 1U, y)) and (current == get(x, y - 1U)) and (current == get(x - 1U, y - 1U))) {
        penalty++;
      }
    }
  }

  return penalty * PENALTY_WEIGHT_2;
}

uint32_t Symbol::penalty3() const {
  uint32_t penalty{0U};

  for (uint16_t y{0U}; y < _symbolSize; y++) {
    penalty += penalty3Line(true, y);
  }

  for (uint16_t x{0U}; x < _symbolSize; x++) {
    penalty += penalty3Line(false, x);
  }

  return penalty;
}

uint32_t Symbol::penalty4() const {
  const auto numModules{static_cast<int32_t>(_symbolSize) * static_cast<int32_t>(_symbolSize)};
  int32_t numDarkModules{0};

  for (uint16_t y{0U}; y < _symbolSize; y++) {
    for (uint16_t x{0U}; x < _symbolSize; x++) {
      if (get(x, y)) {
        numDarkModules++;
      }
    }
  }

  auto deviation{numModules / 2 - numDarkModules};
  if (deviation < 0) {
    deviation = -deviation;
  }

  // grids below 20 modules count every module as a full 5% step
  auto step{numModules / 20};
  if (step == 0) {
    step = 1;
  }

  return PENALTY_WEIGHT_4 * static_cast<uint32_t>(deviation / step);
}

size_t Symbol::indexOf(uint16_t x, uint16_t y) const {
  if ((x >= _symbolSize) or (y >= _symbolSize)) {
    throw std::out_of_range("Symbol: module coordinates outside the symbol");
  }

  return static_cast<size_t>(y + _quietZoneSize) * _fullSize + (x + _quietZoneSize);
}

uint32_t Symbol::penalty3Line(bool alongRow, uint16_t lineNo) const {
  // dark:light:dark:dark:dark:light:dark preceded or followed by 4 light modules
  static constexpr uint16_t PATTERN_WITH_LEADING_LIGHT{0x05d};
  static constexpr uint16_t PATTERN_WITH_TRAILING_LIGHT{0x5d0};
  static constexpr uint16_t PATTERN_AT_LINE_END{0x5d};

  uint32_t penalty{0U};
  uint16_t bitBuffer{0x00};

  for (uint16_t moduleNo{0U}; moduleNo < _symbolSize; moduleNo++) {
    bitBuffer = static_cast<uint16_t>(bitBuffer << 1U);
    if (alongRow ? get(moduleNo, lineNo) : get(lineNo, moduleNo)) {
      bitBuffer |= 0x01;
    }

    const auto window{static_cast<uint16_t>(bitBuffer & 0x7ff)};
    if ((window == PATTERN_WITH_LEADING_LIGHT) or (window == PATTERN_WITH_TRAILING_LIGHT)) {
      penalty += PENALTY_WEIGHT_3;
      bitBuffer = 0xFF;
    } else if ((moduleNo == _symbolSize - 1U) and ((bitBuffer & 0x7f) == PATTERN_AT_LINE_END)) {
      penalty += PENALTY_WEIGHT_3;
      bitBuffer = 0xFF;
    }
  }

  return penalty;
}

}  // namespace qrenc
