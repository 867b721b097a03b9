#include <QrCode/Symbol.hpp>

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

namespace {

using qrenc::Symbol;

// '#' is a dark module, anything else a light one
Symbol symbolOf(const std::vector<std::string>& rows) {
  Symbol symbol{static_cast<uint16_t>(rows.size()), 0U};

  for (uint16_t y{0U}; y < rows.size(); y++) {
    for (uint16_t x{0U}; x < rows[y].size(); x++) {
      symbol.set(x, y, rows[y][x] == '#');
    }
  }

  return symbol;
}

std::vector<std::string> emptyRows(size_t count, size_t width) {
  return std::vector<std::string>(count, std::string(width, '.'));
}

TEST(SymbolTest, StartsEmptyAndLight) {
  const Symbol symbol{3U, 1U};

  EXPECT_EQ(symbol.getSymbolSize(), 3U);
  EXPECT_EQ(symbol.getQuietZoneSize(), 1U);
  EXPECT_EQ(symbol.getFullSize(), 5U);
  EXPECT_EQ(symbol.numEmptyModules(), 9U);
  EXPECT_TRUE(symbol.isEmpty(2U, 2U));
  EXPECT_FALSE(symbol.get(2U, 2U));
}

TEST(SymbolTest, SetsModulesInsideQuietZone) {
  Symbol symbol{3U, 1U};
  symbol.set(0U, 0U, true);
  symbol.set(2U, 1U, false);

  EXPECT_TRUE(symbol.get(0U, 0U));
  EXPECT_FALSE(symbol.isEmpty(2U, 1U));
  EXPECT_EQ(symbol.numEmptyModules(), 7U);

  const auto bitmap{symbol.bitmap()};
  ASSERT_EQ(bitmap.size(), 5U);
  ASSERT_EQ(bitmap[0].size(), 5U);
  EXPECT_TRUE(bitmap[1][1]);
  EXPECT_FALSE(bitmap[0][0]);
  EXPECT_FALSE(bitmap[2][3]);
}

TEST(SymbolTest, SetsPatterns) {
  Symbol symbol{4U, 0U};
  symbol.set2dPattern(1U, 2U, {{true, false, true}, {false, true, false}});

  EXPECT_TRUE(symbol.get(1U, 2U));
  EXPECT_FALSE(symbol.get(2U, 2U));
  EXPECT_TRUE(symbol.get(3U, 2U));
  EXPECT_TRUE(symbol.get(2U, 3U));
  EXPECT_EQ(symbol.numEmptyModules(), 10U);
}

TEST(SymbolTest, RejectsCoordinatesOutsideSymbol) {
  Symbol symbol{3U, 4U};

  EXPECT_THROW(symbol.get(3U, 0U), std::out_of_range);
  EXPECT_THROW(symbol.set(0U, 3U, true), std::out_of_range);
  EXPECT_THROW(symbol.set2dPattern(2U, 2U, {{true, true}}), std::out_of_range);
}

TEST(SymbolTest, ScoresUniformSymbol) {
  const auto symbol{symbolOf(emptyRows(7U, 7U))};

  // 14 lines of 7: 3 + 1 for the 6th module, 1 for the 7th
  EXPECT_EQ(symbol.penalty1(), 70U);
  EXPECT_EQ(symbol.penalty2(), 36U * 3U);
  EXPECT_EQ(symbol.penalty3(), 0U);
  EXPECT_EQ(symbol.penalty4(), 120U);
  EXPECT_EQ(symbol.penaltyScore(), 70U + 108U + 120U);
}

TEST(SymbolTest, ScoresCheckerboardAsZero) {
  std::vector<std::string> rows{};
  for (size_t rowNo{0U}; rowNo < 7U; rowNo++) {
    rows.push_back((rowNo % 2U) ? ".#.#.#." : "#.#.#.#");
  }

  EXPECT_EQ(symbolOf(rows).penaltyScore(), 0U);
}

TEST(SymbolTest, FindsFinderLikePatternFollowedByLightArea) {
  auto rows{emptyRows(11U, 11U)};
  rows[0] = "#.###.#....";

  const auto symbol{symbolOf(rows)};

  EXPECT_EQ(symbol.penalty3(), 40U);
  EXPECT_EQ(symbol.penalty1(), 184U);
  EXPECT_EQ(symbol.penalty2(), 279U);
  EXPECT_EQ(symbol.penalty4(), 90U);
}

TEST(SymbolTest, FindsFinderLikePatternPrecededByLightArea) {
  auto rows{emptyRows(11U, 11U)};
  rows[0] = "....#.###.#";

  EXPECT_EQ(symbolOf(rows).penalty3(), 40U);
}

TEST(SymbolTest, ScoresDarkRatioOfTinySymbols) {
  EXPECT_EQ(symbolOf(emptyRows(4U, 4U)).penalty4(), 80U);
  EXPECT_EQ(symbolOf({"#.#.", ".#.#", "#.#.", ".#.#"}).penalty4(), 0U);
  EXPECT_EQ(symbolOf({"."}).penalty4(), 0U);
  EXPECT_EQ(symbolOf({"#"}).penalty4(), 10U);
}

}  // namespace
