#include <ReedSolomon/GaloisField.hpp>

#include <array>
#include <stdexcept>

namespace reedsolomon {

namespace {

struct GfTables {
  std::array<GfElement, 256U> exp{};  // index form -> polynomial form (exp[255] wraps to exp[0])
  std::array<uint8_t, 256U> log{};    // polynomial form -> index form (log[0] is undefined)
};

constexpr GfTables generateTables() {
  GfTables tables{};
  uint16_t value{1U};

  for (uint16_t power{0U}; power < GaloisField::MULTIPLICATIVE_ORDER; power++) {
    tables.exp[power] = static_cast<GfElement>(value);
    tables.log[value] = static_cast<uint8_t>(power);

    value <<= 1U;
    if (value & 0x0100) {
      value ^= GaloisField::PRIMITIVE_POLYNOMIAL;
    }
  }
  tables.exp[GaloisField::MULTIPLICATIVE_ORDER] = tables.exp[0];

  return tables;
}

constexpr GfTables TABLES{generateTables()};

static_assert(TABLES.exp[8] == 0x1D, "alpha^8 must reduce by the primitive polynomial");
static_assert(TABLES.log[2] == 1U, "alpha must be the primitive element");

}  // namespace

GfElement GaloisField::multiply(GfElement a, GfElement b) {
  if ((a == ZERO) or (b == ZERO)) {
    return ZERO;
  }

  return TABLES.exp[(TABLES.log[a] + TABLES.log[b]) % MULTIPLICATIVE_ORDER];
}

GfElement GaloisField::divide(GfElement a, GfElement b) {
  if (b == ZERO) {
    throw std::domain_error("GF(256): division by zero");
  }

  if (a == ZERO) {
    return ZERO;
  }

  return multiply(a, inverse(b));
}

GfElement GaloisField::inverse(GfElement a) {
  if (a == ZERO) {
    throw std::domain_error("GF(256): zero has no multiplicative inverse");
  }

  return TABLES.exp[MULTIPLICATIVE_ORDER - TABLES.log[a]];
}

GfElement GaloisField::exp(uint16_t power) {
  return TABLES.exp[power % MULTIPLICATIVE_ORDER];
}

uint8_t GaloisField::log(GfElement a) {
  if (a == ZERO) {
    throw std::domain_error("GF(256): logarithm of zero");
  }

  return TABLES.log[a];
}

}  // namespace reedsolomon
