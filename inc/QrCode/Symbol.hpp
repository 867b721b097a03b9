#pragma once

#include <stddef.h>
#include <stdint.h>
#include <vector>

namespace qrenc {

/// @brief Square module grid surrounded by a quiet zone
/// @note Coordinates exclude the quiet zone: (0, 0) is the top left module of the symbol itself.
class Symbol {
public:
  /// @brief Penalty rule weights (ISO/IEC 18004 section 7.8.3)
  static constexpr uint32_t PENALTY_WEIGHT_1{3U};
  static constexpr uint32_t PENALTY_WEIGHT_2{3U};
  static constexpr uint32_t PENALTY_WEIGHT_3{40U};
  static constexpr uint32_t PENALTY_WEIGHT_4{10U};

  /**
   * @brief Constructor
   *
   * @param symbolSize Width (and height) of the symbol in modules
   * @param quietZoneSize Width of the light border on each side
   */
  Symbol(uint16_t symbolSize, uint16_t quietZoneSize);

  /// @brief Module value at (x, y), true for dark
  bool get(uint16_t x, uint16_t y) const;

  /// @brief True if the module at (x, y) hasn't been set yet
  bool isEmpty(uint16_t x, uint16_t y) const;

  /// @brief Set the module at (x, y) and mark it as used
  void set(uint16_t x, uint16_t y, bool value);

  /**
   * @brief Set a rectangular pattern of modules
   *
   * @param x Column of the pattern's top left module
   * @param y Row of the pattern's top left module
   * @param pattern Rows of module values
   */
  void set2dPattern(uint16_t x, uint16_t y, const std::vector<std::vector<bool>>& pattern);

  /// @brief Amount of modules not set yet (quiet zone excluded)
  uint32_t numEmptyModules() const;

  /// @brief Whole grid including the quiet zone, indexed [row][column]
  std::vector<std::vector<bool>> bitmap() const;

  uint16_t getSymbolSize() const { return _symbolSize; }

  uint16_t getQuietZoneSize() const { return _quietZoneSize; }

  /// @brief Width (and height) of the grid including the quiet zone
  uint16_t getFullSize() const { return _fullSize; }

  /// @brief Sum of all four penalty rules, lower is better
  uint32_t penaltyScore() const;

  /// @brief Runs of 6 or more same coloured modules in rows and columns
  uint32_t penalty1() const;

  /// @brief 2x2 blocks of same coloured modules
  uint32_t penalty2() const;

  /// @brief Finder-like 1:1:3:1:1 patterns with a light area in rows and columns
  uint32_t penalty3() const;

  /// @brief Dark module ratio deviation from 50%
  uint32_t penalty4() const;

private:
  uint16_t _symbolSize;

  uint16_t _quietZoneSize;

  uint16_t _fullSize;

  std::vector<bool> _modules;

  std::vector<bool> _used;

  size_t indexOf(uint16_t x, uint16_t y) const;

  uint32_t penalty3Line(bool alongRow, uint16_t lineNo) const;
};

}  // namespace qrenc
