#include <ReedSolomon/GfPoly.hpp>

#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

namespace {

using reedsolomon::GfElement;
using reedsolomon::GfPoly;

GfPoly poly(std::vector<GfElement> terms) {
  return GfPoly{std::move(terms)};
}

TEST(GfPolyTest, DropsLeadingZeroTerms) {
  const auto p{poly({1U, 2U, 0U, 0U})};

  EXPECT_EQ(p.numTerms(), 2U);
  EXPECT_EQ(p.term(1U), 2U);
  EXPECT_EQ(p.term(5U), 0U);
  EXPECT_TRUE(poly({0U, 0U}).isZero());
}

TEST(GfPolyTest, CreatesMonomials) {
  EXPECT_EQ(GfPoly::monomial(7U, 3U), poly({0U, 0U, 0U, 7U}));
  EXPECT_TRUE(GfPoly::monomial(0U, 3U).isZero());
}

TEST(GfPolyTest, InterpretsFirstByteAsHighestDegree) {
  tools::BitVector data{};
  data.appendBytes({0x00, 0x12, 0x34});

  const auto p{GfPoly::fromData(data)};

  EXPECT_EQ(p, poly({0x34, 0x12}));
  EXPECT_EQ(p.data(3U), (std::vector<uint8_t>{0x00, 0x12, 0x34}));
}

TEST(GfPolyTest, ExportsLeftPaddedBytes) {
  const auto p{poly({0x01, 0x02})};

  EXPECT_EQ(p.data(4U), (std::vector<uint8_t>{0x00, 0x00, 0x02, 0x01}));
  EXPECT_THROW(p.data(1U), std::length_error);
}

TEST(GfPolyTest, Adds) {
  EXPECT_EQ(GfPoly::add(poly({0xA0, 0x80, 0xFF, 0x00}), poly({0x0A, 0x82})), poly({0xAA, 0x02, 0xFF}));
  EXPECT_TRUE(GfPoly::add(poly({3U, 4U}), poly({3U, 4U})).isZero());
}

TEST(GfPolyTest, Multiplies) {
  EXPECT_EQ(GfPoly::multiply(poly({0U, 16U, 1U}), poly({128U, 2U})), poly({0U, 232U, 160U, 2U}));
  EXPECT_EQ(GfPoly::multiply(poly({254U, 120U, 88U, 44U, 11U, 1U}), poly({16U, 2U, 0U, 51U, 44U})),
            poly({91U, 50U, 25U, 184U, 194U, 105U, 45U, 244U, 58U, 44U}));
  EXPECT_TRUE(GfPoly::multiply(poly({1U, 2U}), GfPoly{}).isZero());
}

TEST(GfPolyTest, CalculatesRemainder) {
  EXPECT_EQ(GfPoly::remainder(poly({0U, 0U, 0U, 0U, 0U, 0U, 195U, 172U, 24U, 64U}), poly({116U, 147U, 63U, 198U, 31U, 1U})),
            poly({48U, 174U, 34U, 13U, 134U}));

  // x^12 + x^10 over x^8 + x^4 + x^3 + x^2 + 1
  EXPECT_EQ(GfPoly::remainder(poly({0U, 0U, 0U, 0U, 0U, 0U, 0U, 0U, 0U, 0U, 1U, 0U, 1U}), poly({1U, 0U, 1U, 1U, 1U, 0U, 0U, 0U, 1U})),
            poly({1U, 0U, 0U, 1U, 1U, 1U, 0U, 1U}));

  EXPECT_EQ(GfPoly::remainder(poly({1U, 0U, 1U}), poly({0U, 1U})), poly({1U}));
}

TEST(GfPolyTest, RemainderDegreeIsBelowDenominatorDegree) {
  const auto denominator{poly({5U, 9U, 0U, 77U, 1U})};

  for (GfElement seed{1U}; seed < 40U; seed++) {
    std::vector<GfElement> terms{};
    for (GfElement termNo{0U}; termNo < 12U; termNo++) {
      terms.push_back(static_cast<GfElement>(seed * 31U + termNo * 17U));
    }

    const auto result{GfPoly::remainder(poly(terms), denominator)};
    EXPECT_LT(result.numTerms(), denominator.numTerms());
  }
}

TEST(GfPolyTest, RemainderOfShorterNumeratorIsNumerator) {
  EXPECT_EQ(GfPoly::remainder(poly({3U, 1U}), poly({1U, 2U, 3U})), poly({3U, 1U}));
}

TEST(GfPolyTest, RejectsZeroDenominator) {
  EXPECT_THROW(GfPoly::remainder(poly({1U, 1U}), GfPoly{}), std::domain_error);
}

TEST(GfPolyTest, PrintsTerms) {
  EXPECT_EQ(GfPoly{}.toString(), "0");
  EXPECT_EQ(poly({1U, 0U, 3U}).toString(), "3x^2 + 1x^0");
  EXPECT_EQ(poly({2U}).toString(true), "a^1x^0");
}

}  // namespace
